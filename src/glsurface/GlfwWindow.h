#pragma once

#include "Config.h"

#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include <iostream>
#include <stdexcept>

class GlfwWindow {
public:
    explicit GlfwWindow(const WindowConfig& config) {
        glfwSetErrorCallback(errorCallback);

        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }

        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, config.glMajor);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, config.glMinor);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
        glfwWindowHint(GLFW_VISIBLE, config.visible ? GLFW_TRUE : GLFW_FALSE);

        window_ = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
        if (!window_) {
            glfwTerminate();
            throw std::runtime_error("Failed to create window");
        }
        glfwMakeContextCurrent(window_);
        glfwSwapInterval(config.vsync ? 1 : 0);

        // Set user pointer to this, for static callbacks
        glfwSetWindowUserPointer(window_, this);
        glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);
        glfwSetWindowRefreshCallback(window_, refreshCallback);
        glfwSetKeyCallback(window_, keyCallback);

        glfwGetFramebufferSize(window_, &fbWidth_, &fbHeight_);
    }

    ~GlfwWindow() {
        if (window_) {
            glfwDestroyWindow(window_);
        }
        glfwTerminate();
    }

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;
    GlfwWindow(GlfwWindow&&) = delete;
    GlfwWindow& operator=(GlfwWindow&&) = delete;

    GLFWwindow* get() const { return window_; }

    bool shouldClose() const { return glfwWindowShouldClose(window_); }
    void requestClose() const { glfwSetWindowShouldClose(window_, GLFW_TRUE); }
    void pollEvents() const  { glfwPollEvents(); }
    void swapBuffers() const { glfwSwapBuffers(window_); }

    int framebufferWidth()  const { return fbWidth_; }
    int framebufferHeight() const { return fbHeight_; }

    // True once after the framebuffer changed size.
    bool consumeResize() {
        bool r = resized_;
        resized_ = false;
        return r;
    }

    // True once after the window system asked for the contents to be repainted.
    bool consumeRefresh() {
        bool r = refreshed_;
        refreshed_ = false;
        return r;
    }

private:
    GLFWwindow* window_ = nullptr;
    int  fbWidth_  = 0;
    int  fbHeight_ = 0;
    bool resized_  = false;
    bool refreshed_ = false;

    static void errorCallback(int error, const char* description) {
        std::cerr << "GLFW Error " << error << ": " << description << std::endl;
    }

    static void framebufferSizeCallback(GLFWwindow* window, int width, int height) {
        auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
        if (!self) return;
        self->fbWidth_  = width;
        self->fbHeight_ = height;
        self->resized_  = true;
    }

    // Exposed after being covered, restored from minimized, etc.
    static void refreshCallback(GLFWwindow* window) {
        auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
        if (self) self->refreshed_ = true;
    }

    static void keyCallback(GLFWwindow* window, int key, int, int action, int) {
        if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
        }
    }
};
