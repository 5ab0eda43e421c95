#ifndef PATHTRACER_CAMERA_HPP
#define PATHTRACER_CAMERA_HPP

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "color.hpp"
#include "integrator.hpp"
#include "pixel_buffer.hpp"
#include "scene.hpp"
#include "primitives/ray.hpp"
#include "primitives/vector3.hpp"
#include "utils/random.hpp"

class CameraBuilder;

// Called from the rendering thread with the completed fraction and the
// buffer as it is so far. The buffer is locked for the duration of the call.
using RenderProgressCallback = std::function<void(double, const PixelBuffer&)>;

class Camera {
private:
    unsigned int image_width;
    unsigned int image_height;
    Vector3 center;
    Vector3 pixel_origin;   // center of pixel (0, 0)
    Vector3 pixel_delta_u;  // step to the next pixel to the right
    Vector3 pixel_delta_v;  // step to the next pixel below
    double pixel_samples_scale;
    unsigned int samples_per_pixel;
    unsigned int max_bounces;
    unsigned int nr_threads;
    std::optional<uint64_t> seed;

    friend class CameraBuilder;
    Camera() = default;

    void renderRows(const Scene& scene, unsigned int worker, PixelBuffer& output, std::mutex& output_mutex,
                    std::atomic<unsigned int>& rows_done, std::stop_token stop) const {
        if (seed) {
            Random::seedThread(*seed + worker);
        }
        for (unsigned int y = 0; y < image_height; ++y) {
            if (!isRowAssigned(y, worker, nr_threads)) continue;
            if (stop.stop_requested()) return;
            for (unsigned int x = 0; x < image_width; ++x) {
                Color pixel_color{0.0, 0.0, 0.0};
                for (unsigned int sample = 0; sample < samples_per_pixel; ++sample) {
                    const Ray ray = getRay(x, y);
                    pixel_color += rayColor(ray, max_bounces, scene) * pixel_samples_scale;
                }
                pixel_color = pixel_color.toGamma();

                std::lock_guard<std::mutex> lock(output_mutex);
                output.setPixel(x, y, pixel_color);
            }
            ++rows_done;
        }
    }

public:
    unsigned int getImageWidth() const { return image_width; }
    unsigned int getImageHeight() const { return image_height; }
    Vector3 getCenter() const { return center; }
    Vector3 getPixelOrigin() const { return pixel_origin; }
    Vector3 getPixelDeltaU() const { return pixel_delta_u; }
    Vector3 getPixelDeltaV() const { return pixel_delta_v; }
    unsigned int getSamplesPerPixel() const { return samples_per_pixel; }
    unsigned int getMaxBounces() const { return max_bounces; }
    unsigned int getThreadCount() const { return nr_threads; }

    // Worker k owns every row with (row + k) % nr_threads == 0.
    static bool isRowAssigned(unsigned int row, unsigned int worker, unsigned int nr_threads) {
        return (row + worker) % nr_threads == 0;
    }

    // Ray from the eye through a random point in the footprint of pixel (x, y).
    Ray getRay(unsigned int x, unsigned int y) const {
        const double offset_x = Random::uniform() - 0.5;
        const double offset_y = Random::uniform() - 0.5;
        const Vector3 pixel_sample = pixel_origin
                + pixel_delta_u * (x + offset_x)
                + pixel_delta_v * (y + offset_y);
        return Ray{center, pixel_sample - center};
    }

    PixelBuffer renderToBuffer(const Scene& scene, const RenderProgressCallback& progress = {}) const {
        PixelBuffer output(image_width, image_height);
        std::mutex output_mutex;
        std::atomic<unsigned int> rows_done{0};
        std::atomic<unsigned int> workers_done{0};
        std::vector<std::exception_ptr> failures(nr_threads);

        // stopped and joined on unwind
        std::vector<std::jthread> workers;
        workers.reserve(nr_threads);
        for (unsigned int worker = 0; worker < nr_threads; ++worker) {
            workers.emplace_back([&, worker](std::stop_token stop) {
                try {
                    renderRows(scene, worker, output, output_mutex, rows_done, stop);
                } catch (...) {
                    failures[worker] = std::current_exception();
                }
                ++workers_done;
            });
        }

        // supervise until every worker has returned
        if (progress) {
            while (workers_done.load() < nr_threads) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                std::lock_guard<std::mutex> lock(output_mutex);
                progress(static_cast<double>(rows_done.load()) / image_height, output);
            }
        }
        for (auto& worker : workers) {
            worker.join();
        }
        for (const auto& failure : failures) {
            if (failure) std::rethrow_exception(failure);
        }
        if (progress) {
            progress(1.0, output);
        }
        return output;
    }

    // Renders the scene and writes it as a PPM image to path.
    void render(const Scene& scene, const std::string& path = "image.ppm",
                const RenderProgressCallback& progress = {}) const {
        RenderProgressCallback report = progress;
        if (!report) {
            report = [](double done, const PixelBuffer&) {
                printf("\rRendering: %3d%%", static_cast<int>(done * 100.0));
                fflush(stdout);
            };
        }
        const PixelBuffer output = renderToBuffer(scene, report);

        printf("\rWriting to file      ");
        fflush(stdout);
        output.writePpm(path);
        printf("\rDone                 \n");
    }
};

// Collects camera settings and derives the immutable Camera from them.
class CameraBuilder {
private:
    double aspect_ratio = 1.0;
    unsigned int image_width = 100;
    double vfov = 50.0; // degrees
    Vector3 look_from{0.0, 0.0, 0.0};
    Vector3 look_at{0.0, 0.0, -1.0};
    Vector3 camera_up{0.0, 1.0, 0.0};
    double focal_length = 0.0; // 0: distance from look_from to look_at
    unsigned int samples_per_pixel = 10;
    unsigned int max_bounces = 10;
    unsigned int nr_threads = 1;
    std::optional<uint64_t> seed;
public:
    CameraBuilder& setAspectRatio(double ratio) { aspect_ratio = ratio; return *this; }
    CameraBuilder& setImageWidth(unsigned int width) { image_width = width; return *this; }
    CameraBuilder& setVerticalFov(double degrees) { vfov = degrees; return *this; }
    CameraBuilder& setLookFrom(const Vector3& position) { look_from = position; return *this; }
    CameraBuilder& setLookAt(const Vector3& target) { look_at = target; return *this; }
    CameraBuilder& setCameraUp(const Vector3& up) { camera_up = up; return *this; }
    CameraBuilder& setFocalLength(double length) { focal_length = length; return *this; }
    CameraBuilder& setSamplesPerPixel(unsigned int samples) { samples_per_pixel = samples; return *this; }
    CameraBuilder& setMaxBounces(unsigned int bounces) { max_bounces = bounces; return *this; }
    CameraBuilder& setThreadCount(unsigned int threads) { nr_threads = threads; return *this; }
    CameraBuilder& setSeed(uint64_t value) { seed = value; return *this; }

    Camera build() const {
        if (!(aspect_ratio > 0.0)) throw std::invalid_argument("Aspect ratio must be positive");
        if (image_width == 0) throw std::invalid_argument("Image width must be at least one pixel");
        if (samples_per_pixel == 0) throw std::invalid_argument("Samples per pixel must be at least 1");
        if (nr_threads == 0) throw std::invalid_argument("Thread count must be at least 1");
        if (look_from == look_at) throw std::invalid_argument("Camera position and target must differ");
        if (focal_length < 0.0) throw std::invalid_argument("Focal length must not be negative");

        Camera camera;
        camera.image_width = image_width;
        const double height = std::round(image_width / aspect_ratio);
        camera.image_height = height < 1.0 ? 1u : static_cast<unsigned int>(height);
        camera.center = look_from;
        camera.pixel_samples_scale = 1.0 / samples_per_pixel;
        camera.samples_per_pixel = samples_per_pixel;
        camera.max_bounces = max_bounces;
        camera.nr_threads = nr_threads;
        camera.seed = seed;

        const double focus = focal_length > 0.0 ? focal_length : (look_at - look_from).length();
        const double theta = vfov * (std::numbers::pi / 180.0); //Convert to Radians
        const double viewport_height = 2.0 * std::tan(theta * 0.5) * focus;
        const double viewport_width = viewport_height * static_cast<double>(camera.image_width) / camera.image_height;

        // w points from the target back to the eye
        const Vector3 w = (look_from - look_at).normalize();
        const Vector3 u = Vector3::cross(camera_up, w).normalize();
        const Vector3 v = Vector3::cross(w, u);

        const Vector3 viewport_u = u * viewport_width;
        const Vector3 viewport_v = -v * viewport_height;
        camera.pixel_delta_u = viewport_u / camera.image_width;
        camera.pixel_delta_v = viewport_v / camera.image_height;

        const Vector3 viewport_upper_left = camera.center - w * focus - viewport_u / 2.0 - viewport_v / 2.0;
        camera.pixel_origin = viewport_upper_left + (camera.pixel_delta_u + camera.pixel_delta_v) * 0.5;
        return camera;
    }
};

#endif //PATHTRACER_CAMERA_HPP
