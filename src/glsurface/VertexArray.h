#pragma once

#include "VertexAttribute.h"

#include <GL/glew.h>

#include <utility>

class VertexArray {
public:
    VertexArray() {
        glGenVertexArrays(1, &vao_);
    }

    ~VertexArray() {
        if (vao_) {
            glDeleteVertexArrays(1, &vao_);
        }
    }

    VertexArray(const VertexArray&) = delete;
    VertexArray& operator=(const VertexArray&) = delete;

    VertexArray(VertexArray&& other) noexcept : vao_(std::exchange(other.vao_, 0)) {}
    VertexArray& operator=(VertexArray&& other) noexcept {
        if (this != &other) {
            if (vao_) {
                glDeleteVertexArrays(1, &vao_);
            }
            vao_ = std::exchange(other.vao_, 0);
        }
        return *this;
    }

    void bind() const   { glBindVertexArray(vao_); }
    void unbind() const { glBindVertexArray(0); }

    // Records the layout against whatever buffer is bound to GL_ARRAY_BUFFER and
    // enables the slot. The VAO must be bound.
    void setAttribute(const VertexAttribute& attr) const {
        glVertexAttribPointer(attr.location, attr.components, GL_FLOAT,
                              attr.normalized ? GL_TRUE : GL_FALSE,
                              attr.strideBytes,
                              reinterpret_cast<const void*>(attr.offsetBytes));
        glEnableVertexAttribArray(attr.location);
    }

    GLuint id() const { return vao_; }

private:
    GLuint vao_ = 0;
};
