#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include "utils/object_loader.hpp"
#include "materials/lambertian.hpp"

namespace {
const double inf = std::numeric_limits<double>::infinity();

// one unit right triangle in the z = 0 plane and one collinear face
std::string writeTwoFaceObj() {
    const std::string path = ::testing::TempDir() + "two_faces.obj";
    std::ofstream file(path);
    file << "v 0 0 0\n"
            "v 1 0 0\n"
            "v 0 1 0\n"
            "v 0.5 0 0\n"
            "f 1 2 3\n"
            "f 1 4 2\n";
    return path;
}
}

TEST(ObjectLoader, SkipsDegenerateFacesAndSharesMaterial) {
    const std::string path = writeTwoFaceObj();
    const auto material = std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3));
    Scene scene;
    EXPECT_EQ(ObjectLoader::addToScene(scene, path, material), 1u);
    ASSERT_EQ(scene.size(), 1u);

    const auto hit = scene.hit(Ray(Vector3(0.25, 0.25, 1.0), Vector3(0.0, 0.0, -1.0)), Interval(0.00001, inf));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->brdf, material.get());
    std::remove(path.c_str());
}

TEST(ObjectLoader, AppliesScaleAndOffset) {
    const std::string path = writeTwoFaceObj();
    const auto material = std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3));
    const auto triangles = ObjectLoader::loadFromFile(path, material, 2.0, Vector3(0.0, 0.0, -3.0));
    ASSERT_EQ(triangles.size(), 1u);

    // only inside the triangle once it is scaled by 2
    const auto hit = triangles[0].hit(Ray(Vector3(1.5, 0.2, 0.0), Vector3(0.0, 0.0, -1.0)), Interval(0.00001, inf));
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->t, 3.0, 1e-9);
    EXPECT_EQ(hit->brdf, material.get());
    std::remove(path.c_str());
}

TEST(ObjectLoader, NormalizeCentersAndFitsExtent) {
    const std::string path = writeTwoFaceObj();
    const auto material = std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3));
    Scene scene;
    ObjectLoader::addToScene(scene, path, material, 1.0, Vector3(0.0, 0.0, 0.0), 2.0);
    ASSERT_EQ(scene.size(), 1u);

    // bounds [0,1]x[0,1] become [-1,1]x[-1,1]
    const auto inside = scene.hit(Ray(Vector3(-0.5, -0.5, 5.0), Vector3(0.0, 0.0, -1.0)), Interval(0.00001, inf));
    ASSERT_TRUE(inside.has_value());
    EXPECT_NEAR(inside->t, 5.0, 1e-9);
    EXPECT_FALSE(scene.hit(Ray(Vector3(0.2, 0.2, 5.0), Vector3(0.0, 0.0, -1.0)), Interval(0.00001, inf)).has_value());
    std::remove(path.c_str());
}

TEST(ObjectLoader, MissingFileThrows) {
    const auto material = std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3));
    EXPECT_THROW(ObjectLoader::loadFromFile("/nonexistent-directory/missing.obj", material), std::runtime_error);
}
