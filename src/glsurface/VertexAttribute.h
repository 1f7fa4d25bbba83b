#pragma once

#include <cstddef>

// Layout of one shader input slot inside the bound array buffer.
struct VertexAttribute {
    unsigned    location    = 0;
    int         components  = 3;
    bool        normalized  = false;
    int         strideBytes = 0;
    std::size_t offsetBytes = 0;

    // Tightly packed float vectors starting at the beginning of the buffer.
    static constexpr VertexAttribute packedFloats(unsigned location, int components) {
        return VertexAttribute{location, components, false, int(components * sizeof(float)), 0};
    }
};
