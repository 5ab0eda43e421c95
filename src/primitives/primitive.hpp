#ifndef PATHTRACER_PRIMITIVE_HPP
#define PATHTRACER_PRIMITIVE_HPP

#include <optional>
#include "vector3.hpp"
#include "ray.hpp"
#include "interval.hpp"
#include "hit_record.hpp"

class Primitive {
public:
    virtual ~Primitive() = default;

    // Nearest intersection with t strictly inside range, if any.
    virtual std::optional<HitRecord> hit(const Ray& ray, const Interval& range) const = 0;
};

#endif //PATHTRACER_PRIMITIVE_HPP
