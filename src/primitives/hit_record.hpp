#ifndef PATHTRACER_HIT_RECORD_HPP
#define PATHTRACER_HIT_RECORD_HPP

#include "vector3.hpp"
#include "ray.hpp"

class Brdf;

struct HitRecord {
    Vector3 point{};
    Vector3 normal{};   // unit length, always opposes the incoming ray
    double t = 0.0;
    bool front_face = false;
    const Brdf* brdf = nullptr; // owned by the surface that was hit

    // outward_normal must be unit length
    void setFaceNormal(const Ray& ray, const Vector3& outward_normal) {
        front_face = Vector3::dot(ray.getDirection(), outward_normal) < 0.0;
        normal = front_face ? outward_normal : -outward_normal;
    }
};

#endif //PATHTRACER_HIT_RECORD_HPP
