#ifndef PATHTRACER_PIXEL_BUFFER_HPP
#define PATHTRACER_PIXEL_BUFFER_HPP

#include <cstddef>
#include <fstream>
#include <iterator>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "color.hpp"

// Row-major raster of colors, initialized to black.
class PixelBuffer {
private:
    size_t width;
    size_t height;
    std::vector<Color> colors;

    static size_t checkedSize(size_t width, size_t height) {
        if (height != 0 && width > std::numeric_limits<size_t>::max() / height) {
            throw std::overflow_error("Pixel buffer of " + std::to_string(width) + "x" + std::to_string(height) + " is not addressable");
        }
        return width * height;
    }

    void checkBounds(size_t x, size_t y) const {
        if (x >= width || y >= height) {
            throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") outside of "
                                    + std::to_string(width) + "x" + std::to_string(height) + " buffer");
        }
    }
public:
    // Walks pixel coordinates left to right, then top to bottom.
    class LocationIterator {
    private:
        size_t current;
        size_t width;
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::pair<size_t, size_t>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = value_type;

        LocationIterator(size_t current, size_t width) : current(current), width(width) {}

        value_type operator*() const { return {current % width, current / width}; }

        LocationIterator& operator++() {
            ++current;
            return *this;
        }

        LocationIterator operator++(int) {
            LocationIterator previous = *this;
            ++current;
            return previous;
        }

        friend bool operator==(const LocationIterator& a, const LocationIterator& b) {
            return a.current == b.current;
        }

        friend bool operator!=(const LocationIterator& a, const LocationIterator& b) {
            return !(a == b);
        }
    };

    struct Locations {
        size_t width;
        size_t count;
        LocationIterator begin() const { return {0, width}; }
        LocationIterator end() const { return {count, width}; }
    };

    PixelBuffer(size_t width, size_t height)
        : width(width), height(height), colors(checkedSize(width, height), Color(0.0, 0.0, 0.0)) {}

    size_t getWidth() const { return width; }
    size_t getHeight() const { return height; }
    size_t size() const { return colors.size(); }

    void setPixel(size_t x, size_t y, const Color& color) {
        checkBounds(x, y);
        colors[y * width + x] = color;
    }

    Color getPixel(size_t x, size_t y) const {
        checkBounds(x, y);
        return colors[y * width + x];
    }

    Locations locations() const { return {width, colors.size()}; }

    // values in row-major order
    std::vector<Color>::const_iterator begin() const { return colors.begin(); }
    std::vector<Color>::const_iterator end() const { return colors.end(); }

    // Plain text PPM (P3)
    void writePpm(std::ostream& out) const {
        out << "P3\n" << width << " " << height << "\n255\n";
        for (const Color& color : colors) {
            out << color.toPpm();
        }
    }

    void writePpm(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + path);
        }
        writePpm(file);
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed writing image to: " + path);
        }
    }

    friend std::ostream& operator<<(std::ostream& out, const PixelBuffer& buffer) {
        buffer.writePpm(out);
        return out;
    }
};

#endif //PATHTRACER_PIXEL_BUFFER_HPP
