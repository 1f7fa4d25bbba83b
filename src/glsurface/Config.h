#ifndef GLSURFACE_CONFIG_H
#define GLSURFACE_CONFIG_H

#include <string>

#ifndef GLSURFACE_SHADER_DIR
#define GLSURFACE_SHADER_DIR "shaders"
#endif

struct WindowConfig {
    std::string title    = "glsurface - Hello Triangle";
    int         width    = 800;
    int         height   = 600;
    int         glMajor  = 3;
    int         glMinor  = 3;
    bool        vsync    = true;
    bool        visible  = true;
};

struct SurfaceConfig {
    WindowConfig window;

    std::string shaderDir      = GLSURFACE_SHADER_DIR;
    std::string vertexShader   = "shader.vert";
    std::string fragmentShader = "shader.frag";

    // Rotate the clear color hue every frame instead of presenting a static image.
    bool animate = false;

    // 0 means run until the window is closed.
    int maxFrames = 0;

    // Non-empty: capture the first frame to this PNG file and stop.
    std::string screenshotPath;

    bool showHelp = false;

    std::string vertexShaderPath() const;
    std::string fragmentShaderPath() const;
};

// Throws std::invalid_argument on unknown options, missing values or bad numbers.
SurfaceConfig parseArgs(int argc, const char* const* argv);

std::string usage(const std::string& program);

#endif
