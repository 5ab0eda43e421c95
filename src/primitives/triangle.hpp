#ifndef PATHTRACER_TRIANGLE_HPP
#define PATHTRACER_TRIANGLE_HPP

#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>
#include "vector3.hpp"
#include "ray.hpp"
#include "primitive.hpp"
#include "../materials/brdf.hpp"

class Triangle : public Primitive {
private:
    Vector3 v0, v1, v2; // Triangle vertices
    Vector3 normal; // Precomputed normal for the triangle
    std::shared_ptr<const Brdf> brdf;
public:
    Triangle(const Vector3& v0, const Vector3& v1, const Vector3& v2, std::shared_ptr<const Brdf> brdf)
        : v0(v0), v1(v1), v2(v2), brdf(std::move(brdf)) {
        const Vector3 n = Vector3::cross(v1 - v0, v2 - v0);
        if (n.nearZero()) {
            throw std::invalid_argument("Triangle vertices are degenerate");
        }
        if (!this->brdf) {
            throw std::invalid_argument("Triangle needs a material");
        }
        normal = n.normalize();
    }

    Vector3 getNormal() const { return normal; }

    // Moller-Trumbore
    std::optional<HitRecord> hit(const Ray& ray, const Interval& range) const override {
        const double EPSILON = 1e-8;
        Vector3 edge1 = v1 - v0;
        Vector3 edge2 = v2 - v0;
        Vector3 h = Vector3::cross(ray.getDirection(), edge2);
        double a = Vector3::dot(edge1, h);
        if (a > -EPSILON && a < EPSILON)
            return std::nullopt; // Ray is parallel to triangle
        double f = 1.0 / a;
        Vector3 s = ray.getOrigin() - v0;
        double u = f * Vector3::dot(s, h);
        if (u < 0.0 || u > 1.0)
            return std::nullopt;
        Vector3 q = Vector3::cross(s, edge1);
        double v = f * Vector3::dot(ray.getDirection(), q);
        if (v < 0.0 || u + v > 1.0)
            return std::nullopt;
        double t = f * Vector3::dot(edge2, q);
        if (!range.surrounds(t))
            return std::nullopt;

        HitRecord record;
        record.t = t;
        record.point = ray.at(t);
        record.setFaceNormal(ray, normal);
        record.brdf = brdf.get();
        return record;
    }
};


#endif //PATHTRACER_TRIANGLE_HPP
