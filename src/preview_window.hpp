#ifndef PATHTRACER_PREVIEW_WINDOW_HPP
#define PATHTRACER_PREVIEW_WINDOW_HPP

#include "glad/glad.h"
#include <GLFW/glfw3.h>
#include <stdexcept>
#include "pixel_buffer.hpp"

// Shows a pixel buffer while it is being rendered. Must be created and
// updated from the thread that owns the GL context.
class PreviewWindow {
private:
    GLFWwindow* window = nullptr;
    int width;
    int height;

    static double mapToScreen(int j, const int size) {
        return ((2.0*j)/size) - 1.0;
    }
public:
    PreviewWindow(int width, int height) : width(width), height(height) {
        //Init GLFW
        if (!glfwInit())
            throw std::runtime_error("Failed to initialize GLFW");
        window = glfwCreateWindow(width, height, "pathtracer preview", NULL, NULL);
        if (!window) {
            glfwTerminate();
            throw std::runtime_error("Failed to create preview window");
        }
        glfwMakeContextCurrent(window);
        if (!gladLoadGL()) {
            glfwDestroyWindow(window);
            glfwTerminate();
            throw std::runtime_error("Failed to load OpenGL functions");
        }
        glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
            if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
                glfwSetWindowShouldClose(w, GLFW_TRUE);
        });
    }

    PreviewWindow(const PreviewWindow&) = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    ~PreviewWindow() {
        glfwDestroyWindow(window);
        glfwTerminate();
    }

    bool isOpen() const {
        return !glfwWindowShouldClose(window);
    }

    void draw(const PixelBuffer& buffer) {
        if (!isOpen()) return;
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
        glBegin(GL_POINTS);
        for (const auto [x, y] : buffer.locations()) {
            const Color c = buffer.getPixel(x, y);
            glColor3d(c.r(), c.g(), c.b());
            // row 0 is the top of the image, GL's y axis points up
            glVertex2d(mapToScreen(static_cast<int>(x), width),
                       mapToScreen(height - 1 - static_cast<int>(y), height));
        }
        glEnd();
        glfwSwapBuffers(window);
        glfwPollEvents();
    }

    // Keep the finished image on screen until the user closes the window.
    void waitForClose(const PixelBuffer& buffer) {
        while (isOpen()) {
            draw(buffer);
            glfwWaitEvents();
        }
    }
};

#endif //PATHTRACER_PREVIEW_WINDOW_HPP
