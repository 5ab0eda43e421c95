#ifndef PATHTRACER_COLOR_HPP
#define PATHTRACER_COLOR_HPP

#include <cmath>
#include <string>
#include "primitives/vector3.hpp"
#include "primitives/interval.hpp"

// RGB triple. Channels are clamped into [0, 1] on construction and after
// every arithmetic operation, so a Color never holds an out-of-range value.
struct Color {
private:
    Vector3 c;

    static Vector3 clamped(const Vector3& v) {
        static const Interval intensity{0.0, 1.0};
        return {intensity.clamp(v.getX()), intensity.clamp(v.getY()), intensity.clamp(v.getZ())};
    }
public:
    Color() : c({0.0, 0.0, 0.0}) {}
    Color(double r, double g, double b) : c(clamped({r, g, b})) {}

    static Color fromVector(const Vector3& v) {
        return {v.getX(), v.getY(), v.getZ()};
    }

    Vector3 toVector() const { return c; }

    double r() const { return c.getX(); }
    double g() const { return c.getY(); }
    double b() const { return c.getZ(); }

    friend Color operator+(const Color& a, const Color& b) {
        return fromVector(a.c + b.c);
    }

    Color& operator+=(const Color& other) {
        c = clamped(c + other.c);
        return *this;
    }

    // attenuation
    friend Color operator*(const Color& a, const Color& b) {
        return fromVector(a.c * b.c);
    }

    friend Color operator*(const Color& a, double scalar) {
        return fromVector(a.c * scalar);
    }

    friend bool operator==(const Color& a, const Color& b) {
        return a.c == b.c;
    }

    // Square-root gamma, negative channels map to 0.
    Color toGamma() const {
        auto linear_to_gamma = [](double linear) { return linear > 0.0 ? std::sqrt(linear) : 0.0; };
        return {linear_to_gamma(r()), linear_to_gamma(g()), linear_to_gamma(b())};
    }

    // "r g b\n" with each channel scaled to [0, 255]
    std::string toPpm() const {
        const int ir = static_cast<int>(std::floor(r() * 255.999));
        const int ig = static_cast<int>(std::floor(g() * 255.999));
        const int ib = static_cast<int>(std::floor(b() * 255.999));
        return std::to_string(ir) + " " + std::to_string(ig) + " " + std::to_string(ib) + "\n";
    }
};

#endif //PATHTRACER_COLOR_HPP
