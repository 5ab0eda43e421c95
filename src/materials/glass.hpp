#ifndef PATHTRACER_GLASS_HPP
#define PATHTRACER_GLASS_HPP

#include <cmath>
#include "brdf.hpp"
#include "../utils/random.hpp"

// Dielectric. refraction_index is the ratio of the outside medium's index
// over the inside one.
class Glass : public Brdf {
private:
    Color albedo;
    double refraction_index;

    // Schlick's approximation
    static double reflectance(double cosine, double ior) {
        double r0 = (1.0 - ior) / (1.0 + ior);
        r0 = r0 * r0;
        return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5);
    }
public:
    Glass(const Color& albedo, double refraction_index) : albedo(albedo), refraction_index(refraction_index) {}
    explicit Glass(double refraction_index) : Glass(Color(1.0, 1.0, 1.0), refraction_index) {}

    double getRefractionIndex() const { return refraction_index; }

    std::optional<Reflection> scatter(const Ray& incoming, const HitRecord& hit) const override {
        const double ratio = hit.front_face ? (1.0 / refraction_index) : refraction_index;

        const Vector3 unit_direction = incoming.getDirection().normalize();
        const double cos_theta = std::fmin(Vector3::dot(-unit_direction, hit.normal), 1.0);
        const double sin_theta = std::sqrt(1.0 - cos_theta * cos_theta);

        const bool cannot_refract = ratio * sin_theta > 1.0;
        Vector3 direction;
        if (cannot_refract || reflectance(cos_theta, refraction_index) > Random::uniform())
            direction = Vector3::reflect(unit_direction, hit.normal);
        else
            direction = Vector3::refract(unit_direction, hit.normal, ratio);

        return Reflection{Ray{hit.point, direction}, albedo};
    }
};

#endif //PATHTRACER_GLASS_HPP
