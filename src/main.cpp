#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "camera.hpp"
#include "color.hpp"
#include "scene.hpp"
#include "preview_window.hpp"
#include "render_configuration.hpp"
#include "primitives/sphere.hpp"
#include "materials/lambertian.hpp"
#include "materials/metal.hpp"
#include "materials/glass.hpp"
#include "utils/object_loader.hpp"
#include "utils/timer.hpp"

Scene setupScene(const RenderConfiguration& config);
void printUsage(const char* program);

int main(int argc, char** argv) {
    try {
        const RenderConfiguration config = parseArguments(argc, argv);
        if (config.show_help) {
            printUsage(argv[0]);
            return 0;
        }

        Timer timer;
        Scene scene = setupScene(config);
        printf("Scene '%s' with %zu objects built in %f s\n", config.scene_name.c_str(), scene.size(), timer.elapsed());

        CameraBuilder builder;
        builder.setAspectRatio(config.aspect_ratio)
               .setImageWidth(config.image_width)
               .setSamplesPerPixel(config.samples_per_pixel)
               .setMaxBounces(config.max_bounces)
               .setThreadCount(config.nr_threads);
        if (config.scene_name == "materials" || config.scene_name == "glass") {
            builder.setLookFrom({-2.0, 2.0, 1.0})
                   .setLookAt({0.0, 0.0, -1.0})
                   .setVerticalFov(30.0);
        }
        if (config.seed) {
            builder.setSeed(*config.seed);
        }
        const Camera camera = builder.build();
        printf("Rendering %ux%u, %u samples, %u bounces on %u threads\n", camera.getImageWidth(), camera.getImageHeight(),
               camera.getSamplesPerPixel(), camera.getMaxBounces(), camera.getThreadCount());

        timer.reset();
        if (config.preview) {
            PreviewWindow window(static_cast<int>(camera.getImageWidth()), static_cast<int>(camera.getImageHeight()));
            const PixelBuffer image = camera.renderToBuffer(scene, [&window](double done, const PixelBuffer& buffer) {
                printf("\rRendering: %3d%%", static_cast<int>(done * 100.0));
                fflush(stdout);
                window.draw(buffer);
            });
            printf("\rRendered in %f s\n", timer.elapsed());
            image.writePpm(config.output_file);
            printf("Wrote '%s'\n", config.output_file.c_str());
            window.waitForClose(image);
        } else {
            camera.render(scene, config.output_file);
            printf("Rendered in %f s\n", timer.elapsed());
        }
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

Scene setupScene(const RenderConfiguration& config) {
    Scene scene;
    const auto ground = std::make_shared<Lambertian>(Color(0.8, 0.8, 0.0));

    if (config.scene_name == "spheres") {
        const auto diffuse = std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5));
        scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.0), 0.5, diffuse));
        scene.add(std::make_unique<Sphere>(Vector3(0.0, -100.5, -1.0), 100.0, diffuse));
    } else if (config.scene_name == "materials") {
        scene.add(std::make_unique<Sphere>(Vector3(0.0, -100.5, -1.0), 100.0, ground));
        scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.2), 0.5, std::make_shared<Lambertian>(Color(0.1, 0.2, 0.5))));
        scene.add(std::make_unique<Sphere>(Vector3(-1.0, 0.0, -1.0), 0.5, std::make_shared<Glass>(1.5)));
        scene.add(std::make_unique<Sphere>(Vector3(1.0, 0.0, -1.0), 0.5, std::make_shared<Metal>(Color(0.8, 0.6, 0.2))));
    } else if (config.scene_name == "glass") {
        // hollow glass ball: the inner sphere sees air inside glass
        scene.add(std::make_unique<Sphere>(Vector3(0.0, -100.5, -1.0), 100.0, ground));
        scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.0), 0.5, std::make_shared<Glass>(1.5)));
        scene.add(std::make_unique<Sphere>(Vector3(0.0, 0.0, -1.0), 0.4, std::make_shared<Glass>(1.0 / 1.5)));
    } else {
        throw std::invalid_argument("Unknown scene: " + config.scene_name);
    }

    if (!config.object_file.empty()) {
        const auto mesh_material = std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3));
        ObjectLoader::addToScene(scene, config.object_file, mesh_material, config.object_scale, Vector3(0.0, 0.0, -1.0),
                                  config.object_normalize_extent);
    }
    return scene;
}

void printUsage(const char* program) {
    printf("Usage: %s [options]\n"
           "  --scene <spheres|materials|glass>  built-in scene (default materials)\n"
           "  --obj <file>                       add an OBJ mesh to the scene\n"
           "  --obj-scale <s>                    scale applied to the mesh\n"
           "  --obj-normalize <extent>           center the mesh and fit it to extent\n"
           "  --width <px>                       image width (default 400)\n"
           "  --aspect <ratio>                   width / height (default 16/9)\n"
           "  --samples <n>                      samples per pixel (default 100)\n"
           "  --bounces <n>                      maximum bounce depth (default 50)\n"
           "  --threads <n>                      worker threads (default 1)\n"
           "  --seed <n>                         reproducible sampling\n"
           "  --output <file>                    PPM output (default image.ppm)\n"
           "  --preview                          show the image while rendering\n",
           program);
}
