#pragma once

#include <GL/glew.h>

#include <cstddef>
#include <utility>

class VertexBuffer {
public:
    VertexBuffer(const void* data, GLsizeiptr sizeBytes, GLenum usage = GL_STATIC_DRAW)
    : sizeBytes_(std::size_t(sizeBytes))
    {
        glGenBuffers(1, &vbo_);
        // Binding makes every following GL_ARRAY_BUFFER call target this buffer.
        glBindBuffer(GL_ARRAY_BUFFER, vbo_);
        glBufferData(GL_ARRAY_BUFFER, sizeBytes, data, usage);
    }

    ~VertexBuffer() {
        cleanup();
    }

    VertexBuffer(const VertexBuffer&) = delete;
    VertexBuffer& operator=(const VertexBuffer&) = delete;

    VertexBuffer(VertexBuffer&& other) noexcept {
        move(std::move(other));
    }
    VertexBuffer& operator=(VertexBuffer&& other) noexcept {
        if (this != &other) {
            cleanup();
            move(std::move(other));
        }
        return *this;
    }

    void bind() const {
        glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    }

    GLuint id()   const { return vbo_; }
    size_t size() const { return sizeBytes_; }

private:
    GLuint vbo_ = 0;
    size_t sizeBytes_ = 0;

    void cleanup() {
        if (vbo_) {
            glDeleteBuffers(1, &vbo_);
            vbo_ = 0;
        }
    }

    void move(VertexBuffer&& other) {
        vbo_       = other.vbo_;
        sizeBytes_ = other.sizeBytes_;

        other.vbo_       = 0;
        other.sizeBytes_ = 0;
    }
};
