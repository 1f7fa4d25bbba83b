#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>

using Color4 = glm::vec4;

// Fraction of a full hue turn reached after `seconds` at `speed` turns per second.
inline float hueAt(double seconds, float speed) {
    float h = std::fmod(float(seconds) * speed, 1.0f);
    if (h < 0.0f) h += 1.0f;
    return h;
}

// h, s, v in [0, 1]. h wraps, s and v are clamped.
inline Color4 fromHsv(float h, float s, float v, float a = 1.0f) {
    h = h - std::floor(h);
    s = std::clamp(s, 0.0f, 1.0f);
    v = std::clamp(v, 0.0f, 1.0f);

    float scaled = h * 6.0f;
    int   sector = int(scaled) % 6;
    float f      = scaled - std::floor(scaled);

    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (sector) {
        case 0:  return Color4(v, t, p, a);
        case 1:  return Color4(q, v, p, a);
        case 2:  return Color4(p, v, t, a);
        case 3:  return Color4(p, q, v, a);
        case 4:  return Color4(t, p, v, a);
        default: return Color4(v, p, q, a);
    }
}
