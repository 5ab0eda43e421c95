#ifndef PATHTRACER_LAMBERTIAN_HPP
#define PATHTRACER_LAMBERTIAN_HPP

#include "brdf.hpp"

class Lambertian : public Brdf {
private:
    Color albedo;
public:
    explicit Lambertian(const Color& albedo) : albedo(albedo) {}

    Color getAlbedo() const { return albedo; }

    std::optional<Reflection> scatter(const Ray& /*incoming*/, const HitRecord& hit) const override {
        if (albedo == Color(0.0, 0.0, 0.0)) {
            return std::nullopt;
        }

        Vector3 scatter_direction = hit.normal + Vector3::randomUnitVector();
        // normal and sample almost cancel
        if (scatter_direction.nearZero()) {
            scatter_direction = hit.normal;
        }
        return Reflection{Ray{hit.point, scatter_direction}, albedo};
    }
};

#endif //PATHTRACER_LAMBERTIAN_HPP
