#ifndef PATHTRACER_SPHERE_HPP
#define PATHTRACER_SPHERE_HPP

#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>
#include "vector3.hpp"
#include "ray.hpp"
#include "primitive.hpp"
#include "../materials/brdf.hpp"

class Sphere : public Primitive {
private:
    Vector3 center;
    double radius;
    std::shared_ptr<const Brdf> brdf;
public:
    Sphere(const Vector3& center, double radius, std::shared_ptr<const Brdf> brdf)
        : center(center), radius(radius), brdf(std::move(brdf)) {
        if (radius < 0.0) {
            throw std::invalid_argument("Sphere radius must not be negative");
        }
        if (!this->brdf) {
            throw std::invalid_argument("Sphere needs a material");
        }
    }

    Vector3 getCenter() const { return center; }
    double getRadius() const { return radius; }

    std::optional<HitRecord> hit(const Ray& ray, const Interval& range) const override {
        const Vector3 oc = center - ray.getOrigin();
        const double a = ray.getDirection().lengthSquared();
        const double h = Vector3::dot(ray.getDirection(), oc);
        const double c = oc.lengthSquared() - radius * radius;
        const double discriminant = h * h - a * c;
        if (discriminant <= 0.0) {
            return std::nullopt;
        }
        const double sqrtd = std::sqrt(discriminant);

        // prefer the nearer root
        double root = (h - sqrtd) / a;
        if (!range.surrounds(root)) {
            root = (h + sqrtd) / a;
            if (!range.surrounds(root)) {
                return std::nullopt;
            }
        }

        HitRecord record;
        record.t = root;
        record.point = ray.at(root);
        record.setFaceNormal(ray, (record.point - center) / radius);
        record.brdf = brdf.get();
        return record;
    }
};

#endif //PATHTRACER_SPHERE_HPP
