#ifndef PATHTRACER_RAY_HPP
#define PATHTRACER_RAY_HPP

#include "vector3.hpp"

struct Ray {
private:
    Vector3 origin;
    Vector3 direction; // always unit length
public:
    Ray(Vector3 origin, Vector3 direction) : origin(origin), direction(direction.normalize()) {}
    Vector3 getOrigin() const { return origin; }
    Vector3 getDirection() const { return direction; }

    Vector3 at(double t) const { return origin + direction * t; }
};

#endif //PATHTRACER_RAY_HPP
