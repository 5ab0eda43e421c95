#ifndef PATHTRACER_INTEGRATOR_HPP
#define PATHTRACER_INTEGRATOR_HPP

#include <limits>
#include "color.hpp"
#include "scene.hpp"
#include "primitives/ray.hpp"
#include "primitives/interval.hpp"
#include "materials/brdf.hpp"

// Lower bound of the searched t range. Keeps a bounced ray from hitting the
// surface it starts on due to roundoff.
constexpr double SELF_INTERSECTION_EPSILON = 0.00001;

// Vertical white to sky-blue gradient.
inline Color background(const Ray& ray) {
    const double a = 0.5 * (ray.getDirection().normalize().getY() + 1.0);
    return Color::fromVector(Vector3(1.0, 1.0, 1.0) * (1.0 - a) + Vector3(0.5, 0.7, 1.0) * a);
}

// Light arriving along ray, following at most depth bounces.
inline Color rayColor(const Ray& ray, unsigned int depth, const Scene& scene) {
    if (depth == 0) {
        return {0.0, 0.0, 0.0};
    }

    const auto hit = scene.hit(ray, Interval(SELF_INTERSECTION_EPSILON, std::numeric_limits<double>::infinity()));
    if (!hit) {
        return background(ray);
    }

    const auto reflection = hit->brdf->scatter(ray, *hit);
    if (!reflection) {
        return {0.0, 0.0, 0.0};
    }
    return reflection->attenuation * rayColor(reflection->reflected, depth - 1, scene);
}

#endif //PATHTRACER_INTEGRATOR_HPP
