#include "GlLoader.h"

#include "GlErrors.h"

#include <GL/glew.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

const char* glString(GLenum name) {
    const GLubyte* s = glGetString(name);
    return s ? reinterpret_cast<const char*>(s) : "unknown";
}

} // namespace

void loadGlFunctions() {
    glewExperimental = GL_TRUE;
    GLenum err = glewInit();
    if (err != GLEW_OK) {
        throw std::runtime_error(std::string("Failed to initialize GLEW: ") +
                                 reinterpret_cast<const char*>(glewGetErrorString(err)));
    }
    // glewInit can leave GL_INVALID_ENUM behind on core profiles.
    drainGlErrors();
}

void logGlInfo() {
    std::cout << "OpenGL " << glString(GL_VERSION)
              << " (" << glString(GL_RENDERER) << ")" << std::endl;
}
