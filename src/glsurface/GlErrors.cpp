#include "GlErrors.h"

#include <iostream>
#include <stdexcept>

const char* glErrorName(GLenum error) {
    switch (error) {
        case GL_NO_ERROR:                      return "GL_NO_ERROR";
        case GL_INVALID_ENUM:                  return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE:                 return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION:             return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY:                 return "GL_OUT_OF_MEMORY";
        case GL_STACK_UNDERFLOW:               return "GL_STACK_UNDERFLOW";
        case GL_STACK_OVERFLOW:                return "GL_STACK_OVERFLOW";
        default:                               return "unknown GL error";
    }
}

std::vector<GLenum> drainGlErrors() {
    std::vector<GLenum> errors;
    // A lost context keeps reporting errors forever; the cap stops the loop.
    for (int i = 0; i < 32; ++i) {
        GLenum e = glGetError();
        if (e == GL_NO_ERROR) break;
        errors.push_back(e);
    }
    return errors;
}

void checkGlErrors(const std::string& stage) {
    std::vector<GLenum> errors = drainGlErrors();
    if (errors.empty()) return;

    for (GLenum e : errors) {
        std::cerr << "GL error during " << stage << ": " << glErrorName(e)
                  << " (0x" << std::hex << e << std::dec << ")" << std::endl;
    }
    throw std::runtime_error("OpenGL reported " + std::to_string(errors.size()) +
                             " error(s) during " + stage);
}
