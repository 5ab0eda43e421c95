#ifndef PATHTRACER_BRDF_HPP
#define PATHTRACER_BRDF_HPP

#include <optional>
#include "../color.hpp"
#include "../primitives/ray.hpp"
#include "../primitives/hit_record.hpp"

// Outgoing ray and the attenuation applied to the light returning along it.
struct Reflection {
    Ray reflected;
    Color attenuation;
};

// A material. Implementations hold no mutable state and may be shared by
// any number of surfaces and render threads at once.
class Brdf {
public:
    virtual ~Brdf() = default;

    // std::nullopt means the incoming light is fully absorbed.
    virtual std::optional<Reflection> scatter(const Ray& incoming, const HitRecord& hit) const = 0;
};

#endif //PATHTRACER_BRDF_HPP
