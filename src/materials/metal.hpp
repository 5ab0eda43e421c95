#ifndef PATHTRACER_METAL_HPP
#define PATHTRACER_METAL_HPP

#include "brdf.hpp"

// Perfect mirror.
class Metal : public Brdf {
private:
    Color albedo;
public:
    explicit Metal(const Color& albedo) : albedo(albedo) {}

    std::optional<Reflection> scatter(const Ray& incoming, const HitRecord& hit) const override {
        if (albedo == Color(0.0, 0.0, 0.0)) {
            return std::nullopt;
        }
        const Vector3 reflected = Vector3::reflect(incoming.getDirection(), hit.normal);
        return Reflection{Ray{hit.point, reflected}, albedo};
    }
};

#endif //PATHTRACER_METAL_HPP
