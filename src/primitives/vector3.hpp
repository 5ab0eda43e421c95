#ifndef PATHTRACER_VECTOR3_HPP
#define PATHTRACER_VECTOR3_HPP

#include <cmath>
#include <stdexcept>
#include "../utils/random.hpp"

class Vector3 {
private:
    double x, y, z;
public:
    Vector3() : Vector3(0.0, 0.0, 0.0) {}

    Vector3(double x, double y, double z) : x(x), y(y), z(z) {}

    double getX() const { return x; }

    double getY() const { return y; }

    double getZ() const { return z; }

    double getAxis(int axis) const {
        switch(axis) {
            case 0: return x;
            case 1: return y;
            case 2: return z;
            default: throw std::out_of_range("Axis must be 0, 1, or 2");
        }
    }

    friend Vector3 operator+(const Vector3 &v1, const Vector3 &v2) {
        return {v1.x + v2.x, v1.y + v2.y, v1.z + v2.z};
    }

    friend Vector3 operator-(const Vector3 &v1, const Vector3 &v2) {
        return {v1.x - v2.x, v1.y - v2.y, v1.z - v2.z};
    }

    friend Vector3 operator-(const Vector3 &v) {
        return {-v.x, -v.y, -v.z};
    }

    friend Vector3 operator*(const Vector3 &v, double scalar) {
        return {v.x * scalar, v.y * scalar, v.z * scalar};
    }

    friend Vector3 operator*(double scalar, const Vector3 &v) {
        return v * scalar;
    }

    // component-wise
    friend Vector3 operator*(const Vector3 &v1, const Vector3 &v2) {
        return {v1.x * v2.x, v1.y * v2.y, v1.z * v2.z};
    }

    // no guard against zero, IEEE semantics apply
    friend Vector3 operator/(const Vector3 &v, double scalar) {
        return {v.x / scalar, v.y / scalar, v.z / scalar};
    }

    Vector3& operator+=(const Vector3 &other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    Vector3& operator-=(const Vector3 &other) {
        x -= other.x;
        y -= other.y;
        z -= other.z;
        return *this;
    }

    Vector3& operator*=(double scalar) {
        x *= scalar;
        y *= scalar;
        z *= scalar;
        return *this;
    }

    static double dot(const Vector3 &v1, const Vector3 &v2) {
        return v1.x * v2.x + v1.y * v2.y + v1.z * v2.z;
    }

    static Vector3 cross(const Vector3 &v1, const Vector3 &v2) {
        return {
                v1.y * v2.z - v1.z * v2.y,
                v1.z * v2.x - v1.x * v2.z,
                v1.x * v2.y - v1.y * v2.x
        };
    }

    // Mirror d about the plane with unit normal n
    static Vector3 reflect(const Vector3 &d, const Vector3 &n) {
        return d - n * (2.0 * dot(d, n));
    }

    // Snell's law for a unit incoming direction uv, split into the parts
    // perpendicular and parallel to the normal. eta is n_incoming / n_outgoing.
    static Vector3 refract(const Vector3 &uv, const Vector3 &n, double eta) {
        const double cos_theta = std::fmin(dot(-uv, n), 1.0);
        const Vector3 r_out_perp = (uv + n * cos_theta) * eta;
        const Vector3 r_out_parallel = n * -std::sqrt(std::fabs(1.0 - r_out_perp.lengthSquared()));
        return r_out_perp + r_out_parallel;
    }

    double lengthSquared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(lengthSquared());
    }

    friend bool operator==(const Vector3 &v1, const Vector3 &v2) {
        return (v1.x == v2.x) && (v1.y == v2.y) && (v1.z == v2.z);
    }

    Vector3 normalize() const {
        return *this / length();
    }

    bool nearZero() const {
        const double s = 1e-8;
        return (std::fabs(x) < s) && (std::fabs(y) < s) && (std::fabs(z) < s);
    }

    static Vector3 random() {
        return {Random::uniform(), Random::uniform(), Random::uniform()};
    }

    static Vector3 random(double min, double max) {
        return {Random::uniform(min, max), Random::uniform(min, max), Random::uniform(min, max)};
    }

    // Rejection sampling inside the unit ball, projected onto its surface.
    // The lower bound keeps the rescale away from underflow.
    static Vector3 randomUnitVector() {
        while (true) {
            const Vector3 p = random(-1.0, 1.0);
            const double lensq = p.lengthSquared();
            if (1e-160 < lensq && lensq <= 1.0)
                return p / std::sqrt(lensq);
        }
    }

    static Vector3 randomOnHemisphere(const Vector3 &normal) {
        const Vector3 on_unit_sphere = randomUnitVector();
        if (dot(on_unit_sphere, normal) > 0.0)
            return on_unit_sphere;
        return -on_unit_sphere;
    }
};


#endif //PATHTRACER_VECTOR3_HPP
