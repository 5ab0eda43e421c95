#include <gtest/gtest.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include "camera.hpp"
#include "primitives/sphere.hpp"
#include "materials/lambertian.hpp"
#include "materials/metal.hpp"
#include "materials/glass.hpp"

namespace {
Scene twoSpheres() {
    Scene scene;
    const auto diffuse = std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5));
    scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.0), 0.5, diffuse));
    scene.add(std::make_unique<Sphere>(Vector3(0.0, -100.5, -1.0), 100.0, diffuse));
    return scene;
}

Scene mixedMaterials() {
    Scene scene;
    scene.add(std::make_unique<Sphere>(Vector3(0.0, -100.5, -1.0), 100.0, std::make_shared<Lambertian>(Color(0.8, 0.8, 0.0))));
    scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.2), 0.5, std::make_shared<Lambertian>(Color(0.1, 0.2, 0.5))));
    scene.add(std::make_unique<Sphere>(Vector3(-1.0, 0.0, -1.0), 0.5, std::make_shared<Glass>(1.5)));
    scene.add(std::make_unique<Sphere>(Vector3(1.0, 0.0, -1.0), 0.5, std::make_shared<Metal>(Color(0.8, 0.6, 0.2))));
    return scene;
}
}

TEST(CameraBuilder, Defaults) {
    const Camera camera = CameraBuilder().build();
    EXPECT_EQ(camera.getImageWidth(), 100u);
    EXPECT_EQ(camera.getImageHeight(), 100u);
    EXPECT_EQ(camera.getSamplesPerPixel(), 10u);
    EXPECT_EQ(camera.getMaxBounces(), 10u);
    EXPECT_EQ(camera.getThreadCount(), 1u);
    EXPECT_EQ(camera.getCenter(), Vector3(0.0, 0.0, 0.0));
}

TEST(CameraBuilder, HeightIsRoundedAndAtLeastOne) {
    EXPECT_EQ(CameraBuilder().setImageWidth(400).setAspectRatio(16.0 / 9.0).build().getImageHeight(), 225u);
    EXPECT_EQ(CameraBuilder().setImageWidth(20).setAspectRatio(16.0 / 9.0).build().getImageHeight(), 11u);
    EXPECT_EQ(CameraBuilder().setImageWidth(100).setAspectRatio(1.5).build().getImageHeight(), 67u);
    EXPECT_EQ(CameraBuilder().setImageWidth(1).setAspectRatio(10.0).build().getImageHeight(), 1u);
}

TEST(CameraBuilder, RejectsInvalidSettings) {
    EXPECT_THROW(CameraBuilder().setSamplesPerPixel(0).build(), std::invalid_argument);
    EXPECT_THROW(CameraBuilder().setThreadCount(0).build(), std::invalid_argument);
    EXPECT_THROW(CameraBuilder().setAspectRatio(0.0).build(), std::invalid_argument);
    EXPECT_THROW(CameraBuilder().setImageWidth(0).build(), std::invalid_argument);
    EXPECT_THROW(CameraBuilder().setLookAt(Vector3(0.0, 0.0, 0.0)).build(), std::invalid_argument);
}

TEST(Camera, ViewportGeometry) {
    const Camera camera = CameraBuilder().setImageWidth(101).setVerticalFov(90.0).build();
    // vfov 90 at focal length 1 gives a 2x2 viewport
    EXPECT_NEAR(camera.getPixelDeltaU().getX(), 2.0 / 101, 1e-12);
    EXPECT_NEAR(camera.getPixelDeltaV().getY(), -2.0 / 101, 1e-12);
    EXPECT_NEAR(camera.getPixelOrigin().getZ(), -1.0, 1e-12);
    EXPECT_NEAR(camera.getPixelOrigin().getX(), -1.0 + 1.0 / 101, 1e-12);
    EXPECT_NEAR(camera.getPixelOrigin().getY(), 1.0 - 1.0 / 101, 1e-12);
}

TEST(Camera, RaysStayInsidePixelFootprint) {
    const Camera camera = CameraBuilder().setImageWidth(101).setVerticalFov(90.0).build();
    const double half_pixel = 1.0 / 101;
    for (int i = 0; i < 200; ++i) {
        const Ray ray = camera.getRay(50, 50);
        EXPECT_EQ(ray.getOrigin(), camera.getCenter());
        // scale the direction back onto the z = -1 viewport plane
        const Vector3 on_plane = ray.getDirection() / -ray.getDirection().getZ();
        EXPECT_LE(std::fabs(on_plane.getX()), half_pixel + 1e-12);
        EXPECT_LE(std::fabs(on_plane.getY()), half_pixel + 1e-12);
    }
}

TEST(Camera, LookAtOrientsBasis) {
    const Camera camera = CameraBuilder()
            .setLookFrom(Vector3(0.0, 0.0, 5.0))
            .setLookAt(Vector3(0.0, 0.0, 0.0))
            .build();
    // focal length follows the distance to the target
    EXPECT_NEAR(camera.getPixelOrigin().getZ(), 0.0, 1e-12);
    EXPECT_GT(camera.getPixelDeltaU().getX(), 0.0);
    EXPECT_LT(camera.getPixelDeltaV().getY(), 0.0);
}

TEST(Camera, RowPartitionCoversEveryPixelOnce) {
    const unsigned int height = 37;
    for (unsigned int threads = 1; threads <= 8; ++threads) {
        for (unsigned int row = 0; row < height; ++row) {
            int owners = 0;
            for (unsigned int worker = 0; worker < threads; ++worker) {
                if (Camera::isRowAssigned(row, worker, threads)) ++owners;
            }
            EXPECT_EQ(owners, 1) << "row " << row << " with " << threads << " threads";
        }
    }
}

TEST(Camera, ZeroBouncesRendersBlack) {
    const Scene scene = twoSpheres();
    const Camera camera = CameraBuilder()
            .setImageWidth(20)
            .setAspectRatio(16.0 / 9.0)
            .setMaxBounces(0)
            .setSamplesPerPixel(4)
            .setThreadCount(3)
            .build();
    const PixelBuffer image = camera.renderToBuffer(scene);
    EXPECT_EQ(image.getWidth(), 20u);
    EXPECT_EQ(image.getHeight(), 11u);
    for (const Color& color : image) {
        EXPECT_EQ(color, Color(0.0, 0.0, 0.0));
    }
}

TEST(Camera, EmptySceneRendersSkyGradient) {
    const Scene scene;
    const Camera camera = CameraBuilder().setImageWidth(16).setSamplesPerPixel(1).setThreadCount(2).build();
    const PixelBuffer image = camera.renderToBuffer(scene);
    const Color top = image.getPixel(8, 0);
    const Color bottom = image.getPixel(8, image.getHeight() - 1);
    EXPECT_LT(top.r(), bottom.r());
    EXPECT_DOUBLE_EQ(top.b(), 1.0);
    EXPECT_DOUBLE_EQ(bottom.b(), 1.0);
}

TEST(Camera, SeededRenderIsReproducible) {
    const Scene scene = mixedMaterials();
    const Camera camera = CameraBuilder()
            .setImageWidth(24)
            .setAspectRatio(16.0 / 9.0)
            .setSamplesPerPixel(1)
            .setMaxBounces(8)
            .setThreadCount(3)
            .setSeed(1234)
            .build();
    const PixelBuffer first = camera.renderToBuffer(scene);
    const PixelBuffer second = camera.renderToBuffer(scene);
    for (const auto [x, y] : first.locations()) {
        EXPECT_EQ(first.getPixel(x, y), second.getPixel(x, y)) << "pixel " << x << ", " << y;
    }
}

TEST(Camera, ReportsProgressUntilDone) {
    const Scene scene = twoSpheres();
    const Camera camera = CameraBuilder().setImageWidth(8).setSamplesPerPixel(1).setThreadCount(2).build();
    double last = -1.0;
    int calls = 0;
    camera.renderToBuffer(scene, [&](double done, const PixelBuffer& buffer) {
        EXPECT_GE(done, 0.0);
        EXPECT_LE(done, 1.0);
        EXPECT_EQ(buffer.getWidth(), 8u);
        last = done;
        ++calls;
    });
    EXPECT_GE(calls, 1);
    EXPECT_DOUBLE_EQ(last, 1.0);
}

TEST(Camera, RenderWritesPpmFile) {
    const Scene scene = twoSpheres();
    const Camera camera = CameraBuilder().setImageWidth(20).setAspectRatio(16.0 / 9.0).setSamplesPerPixel(2).build();
    const std::string path = ::testing::TempDir() + "camera_render_test.ppm";
    camera.render(scene, path, [](double, const PixelBuffer&) {});

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    std::string magic;
    unsigned int width = 0;
    unsigned int height = 0;
    unsigned int max_value = 0;
    file >> magic >> width >> height >> max_value;
    EXPECT_EQ(magic, "P3");
    EXPECT_EQ(width, 20u);
    EXPECT_EQ(height, 11u);
    EXPECT_EQ(max_value, 255u);

    unsigned int channels = 0;
    int value = 0;
    while (file >> value) {
        EXPECT_GE(value, 0);
        EXPECT_LE(value, 255);
        ++channels;
    }
    EXPECT_EQ(channels, 20u * 11u * 3u);
    std::remove(path.c_str());
}

TEST(Camera, RenderToUnwritablePathThrows) {
    const Scene scene;
    const Camera camera = CameraBuilder().setImageWidth(4).setSamplesPerPixel(1).build();
    EXPECT_THROW(camera.render(scene, "/nonexistent-directory/image.ppm", [](double, const PixelBuffer&) {}),
                 std::runtime_error);
}

TEST(Camera, ThrowingProgressCallbackStopsWorkersAndPropagates) {
    const Scene scene = twoSpheres();
    const Camera camera = CameraBuilder()
            .setImageWidth(200)
            .setSamplesPerPixel(50)
            .setThreadCount(4)
            .build();
    EXPECT_THROW(camera.renderToBuffer(scene, [](double, const PixelBuffer&) {
        throw std::runtime_error("preview closed");
    }), std::runtime_error);
}

TEST(Camera, RenderWithoutCallbackReturnsFinishedImage) {
    const Scene scene;
    const Camera camera = CameraBuilder().setImageWidth(4).setSamplesPerPixel(1).setThreadCount(2).build();
    const PixelBuffer image = camera.renderToBuffer(scene);
    for (const Color& color : image) {
        EXPECT_DOUBLE_EQ(color.b(), 1.0);
    }
}
