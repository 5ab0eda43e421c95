#ifndef PATHTRACER_OBJECT_LOADER_HPP
#define PATHTRACER_OBJECT_LOADER_HPP

#include <algorithm>
#include <cstdio>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <OBJ_Loader.h>
#include "../primitives/vector3.hpp"
#include "../primitives/triangle.hpp"
#include "../materials/brdf.hpp"
#include "../scene.hpp"

class ObjectLoader {
private:
    static Vector3 toVector(const objl::Vertex& v) {
        return {v.Position.X, v.Position.Y, v.Position.Z};
    }
public:
    // Reads every mesh of an OBJ file as triangles sharing one material.
    // With centerAndNormalize the model is moved to the origin and its
    // largest extent scaled to targetExtent before scale and offset apply.
    // Degenerate faces are skipped.
    static std::vector<Triangle> loadFromFile(const std::string& path, const std::shared_ptr<const Brdf>& brdf,
                                              const double scale = 1.0, const Vector3& offset = {},
                                              bool centerAndNormalize = false, double targetExtent = 1.0) {
        objl::Loader loader;
        if (!loader.LoadFile(path)) {
            throw std::runtime_error("Failed to load OBJ file: " + path);
        }

        Vector3 minB{ std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), std::numeric_limits<double>::max() };
        Vector3 maxB{ std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest() };
        if (centerAndNormalize) {
            for (const auto& mesh : loader.LoadedMeshes) {
                for (const auto& v : mesh.Vertices) {
                    const Vector3 p = toVector(v);
                    minB = { std::min(minB.getX(), p.getX()), std::min(minB.getY(), p.getY()), std::min(minB.getZ(), p.getZ()) };
                    maxB = { std::max(maxB.getX(), p.getX()), std::max(maxB.getY(), p.getY()), std::max(maxB.getZ(), p.getZ()) };
                }
            }
        }
        Vector3 center{0,0,0};
        double normScale = 1.0;
        if (centerAndNormalize) {
            center = (minB + maxB) * 0.5;
            Vector3 size = maxB - minB;
            double maxExtent = std::max({size.getX(), size.getY(), size.getZ()});
            if (maxExtent > 0.0 && targetExtent > 0.0) normScale = targetExtent / maxExtent;
        }
        auto place = [&](const objl::Vertex& v) {
            Vector3 p = toVector(v);
            if (centerAndNormalize) p = (p - center) * normScale;
            return p * scale + offset;
        };

        std::vector<Triangle> triangles;
        size_t skipped = 0;
        auto emit = [&](const Vector3& v0, const Vector3& v1, const Vector3& v2) {
            if (Vector3::cross(v1 - v0, v2 - v0).nearZero()) {
                ++skipped;
                return;
            }
            triangles.emplace_back(v0, v1, v2, brdf);
        };

        for (const auto& mesh : loader.LoadedMeshes) {
            const auto& verts = mesh.Vertices;
            const auto& idx = mesh.Indices;
            if (idx.empty()) {
                triangles.reserve(triangles.size() + verts.size() / 3);
                for (size_t i = 0; i + 2 < verts.size(); i += 3) {
                    emit(place(verts[i]), place(verts[i+1]), place(verts[i+2]));
                }
            } else {
                triangles.reserve(triangles.size() + idx.size() / 3);
                for (size_t i = 0; i + 2 < idx.size(); i += 3) {
                    unsigned int i0 = idx[i];
                    unsigned int i1 = idx[i+1];
                    unsigned int i2 = idx[i+2];
                    if (i0 >= verts.size() || i1 >= verts.size() || i2 >= verts.size()) continue;
                    emit(place(verts[i0]), place(verts[i1]), place(verts[i2]));
                }
            }
        }
        if (skipped > 0) {
            printf("Skipped %zu degenerate faces in '%s'\n", skipped, path.c_str());
        }
        return triangles;
    }

    // normalizeExtent: fit the model to this size around the origin first
    static size_t addToScene(Scene& scene, const std::string& path, const std::shared_ptr<const Brdf>& brdf,
                             const double scale = 1.0, const Vector3& offset = {},
                             std::optional<double> normalizeExtent = std::nullopt) {
        const auto triangles = loadFromFile(path, brdf, scale, offset,
                                            normalizeExtent.has_value(), normalizeExtent.value_or(1.0));
        for (const auto& triangle : triangles) {
            scene.add(std::make_unique<Triangle>(triangle));
        }
        printf("Loaded %zu triangles from OBJ file '%s'\n", triangles.size(), path.c_str());
        return triangles.size();
    }
};

#endif //PATHTRACER_OBJECT_LOADER_HPP
