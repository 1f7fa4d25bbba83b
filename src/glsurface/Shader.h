#pragma once

#include <GL/glew.h>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

class ShaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Shader {
public:
    Shader(const char* vertexSrc, const char* fragmentSrc) {
        program_ = createShaderProgram(vertexSrc, fragmentSrc);
    }

    // Both files are read before any GL call, so a bad path fails without a context.
    static Shader fromFiles(const std::string& vertexPath, const std::string& fragmentPath) {
        std::string vs = readTextFile(vertexPath);
        std::string fs = readTextFile(fragmentPath);
        return Shader(vs.c_str(), fs.c_str());
    }

    ~Shader() {
        if (program_) {
            glDeleteProgram(program_);
        }
    }

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    Shader(Shader&& other) noexcept : program_(std::exchange(other.program_, 0)) {}
    Shader& operator=(Shader&& other) noexcept {
        if (this != &other) {
            if (program_) {
                glDeleteProgram(program_);
            }
            program_ = std::exchange(other.program_, 0);
        }
        return *this;
    }

    GLuint id() const { return program_; }

    void use() const {
        glUseProgram(program_);
    }

    GLint uniformLocation(const char* name) const {
        return glGetUniformLocation(program_, name);
    }

    // Silently skips uniforms the linker optimized out.
    void setVec4(const char* name, const glm::vec4& value) const {
        GLint loc = uniformLocation(name);
        if (loc >= 0) {
            glUniform4fv(loc, 1, glm::value_ptr(value));
        }
    }

    static std::string readTextFile(const std::string& path) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            throw ShaderError("Failed to open shader source " + path);
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad()) {
            throw ShaderError("Failed to read shader source " + path);
        }
        return contents.str();
    }

private:
    GLuint program_ = 0;

    static const char* stageName(GLenum type) {
        return type == GL_VERTEX_SHADER ? "vertex" : "fragment";
    }

    static GLuint compileShader(GLenum type, const char* src) {
        GLuint s = glCreateShader(type);
        if (!s) {
            throw ShaderError(std::string("glCreateShader failed for the ") + stageName(type) + " stage");
        }
        glShaderSource(s, 1, &src, nullptr);
        glCompileShader(s);
        GLint success = GL_FALSE;
        glGetShaderiv(s, GL_COMPILE_STATUS, &success);
        if (!success) {
            char log[512] = {};
            glGetShaderInfoLog(s, 512, nullptr, log);
            glDeleteShader(s);
            throw ShaderError(std::string("Shader compile error (") + stageName(type) + "):\n" + log);
        }
        return s;
    }

    static GLuint createShaderProgram(const char* vsSrc, const char* fsSrc) {
        GLuint vs = compileShader(GL_VERTEX_SHADER, vsSrc);
        GLuint fs = 0;
        try {
            fs = compileShader(GL_FRAGMENT_SHADER, fsSrc);
        } catch (const ShaderError&) {
            glDeleteShader(vs);
            throw;
        }

        GLuint prog = glCreateProgram();
        if (!prog) {
            glDeleteShader(vs);
            glDeleteShader(fs);
            throw ShaderError("glCreateProgram failed");
        }
        glAttachShader(prog, vs);
        glAttachShader(prog, fs);
        glLinkProgram(prog);

        glDeleteShader(vs);
        glDeleteShader(fs);

        GLint success = GL_FALSE;
        glGetProgramiv(prog, GL_LINK_STATUS, &success);
        if (!success) {
            char log[512] = {};
            glGetProgramInfoLog(prog, 512, nullptr, log);
            glDeleteProgram(prog);
            throw ShaderError(std::string("Program link error:\n") + log);
        }
        return prog;
    }
};
