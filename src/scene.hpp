#ifndef PATHTRACER_SCENE_HPP
#define PATHTRACER_SCENE_HPP

#include <memory>
#include <optional>
#include <vector>
#include "primitives/primitive.hpp"
#include "primitives/interval.hpp"

// Flat, unordered list of surfaces. Intersection is a linear scan.
// Not mutated while a render is running.
class Scene {
private:
    std::vector<std::unique_ptr<Primitive>> objects;
public:
    Scene() = default;
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;
    Scene(Scene&&) noexcept = default;
    Scene& operator=(Scene&&) noexcept = default;

    void add(std::unique_ptr<Primitive> object) {
        objects.push_back(std::move(object));
    }

    void clear() {
        objects.clear();
    }

    size_t size() const { return objects.size(); }
    bool empty() const { return objects.empty(); }

    const std::vector<std::unique_ptr<Primitive>>& getObjects() const { return objects; }

    // Nearest hit over all objects. The upper bound shrinks to the closest
    // t found so far, so on equal t the first object added wins.
    std::optional<HitRecord> hit(const Ray& ray, const Interval& range) const {
        std::optional<HitRecord> closest;
        double closest_so_far = range.getMax();
        for (const auto& object : objects) {
            if (auto record = object->hit(ray, Interval(range.getMin(), closest_so_far))) {
                closest_so_far = record->t;
                closest = record;
            }
        }
        return closest;
    }
};

#endif //PATHTRACER_SCENE_HPP
