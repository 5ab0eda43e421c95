#ifndef PATHTRACER_RENDER_CONFIGURATION_HPP
#define PATHTRACER_RENDER_CONFIGURATION_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

struct RenderConfiguration {
    std::string scene_name = "materials";
    std::string object_file;
    double object_scale = 1.0;
    std::optional<double> object_normalize_extent;
    unsigned int image_width = 400;
    double aspect_ratio = 16.0 / 9.0;
    unsigned int samples_per_pixel = 100;
    unsigned int max_bounces = 50;
    unsigned int nr_threads = 1;
    std::optional<uint64_t> seed;
    std::string output_file = "image.ppm";
    bool preview = false;
    bool show_help = false;
};

// Whole decimal string in [0, UINT_MAX]. Signs and trailing text are rejected.
inline unsigned int parseUnsigned(const std::string& option, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Expected a non-negative integer for " + option + ", got '" + text + "'");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value for " + option + " is too large: " + text);
    }
    if (value > std::numeric_limits<unsigned int>::max()) {
        throw std::invalid_argument("Value for " + option + " is too large: " + text);
    }
    return static_cast<unsigned int>(value);
}

inline double parseDouble(const std::string& option, const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Expected a number for " + option + ", got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("Expected a number for " + option + ", got '" + text + "'");
    }
    return value;
}

inline RenderConfiguration parseArguments(int argc, const char* const* argv) {
    RenderConfiguration config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--scene") {
            config.scene_name = value();
        } else if (arg == "--obj") {
            config.object_file = value();
        } else if (arg == "--obj-scale") {
            config.object_scale = parseDouble(arg, value());
        } else if (arg == "--obj-normalize") {
            const double extent = parseDouble(arg, value());
            if (!(extent > 0.0)) throw std::invalid_argument("--obj-normalize needs a positive extent");
            config.object_normalize_extent = extent;
        } else if (arg == "--width") {
            config.image_width = parseUnsigned(arg, value());
        } else if (arg == "--aspect") {
            config.aspect_ratio = parseDouble(arg, value());
        } else if (arg == "--samples") {
            config.samples_per_pixel = parseUnsigned(arg, value());
        } else if (arg == "--bounces") {
            config.max_bounces = parseUnsigned(arg, value());
        } else if (arg == "--threads") {
            config.nr_threads = parseUnsigned(arg, value());
        } else if (arg == "--seed") {
            const std::string text = value();
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument("Expected a non-negative integer for --seed, got '" + text + "'");
            }
            try {
                config.seed = std::stoull(text);
            } catch (const std::out_of_range&) {
                throw std::invalid_argument("Value for --seed is too large: " + text);
            }
        } else if (arg == "--output") {
            config.output_file = value();
        } else if (arg == "--preview") {
            config.preview = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return config;
}

#endif //PATHTRACER_RENDER_CONFIGURATION_HPP
