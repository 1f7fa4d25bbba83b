#ifndef GLSURFACE_TRIANGLEVIEW_H
#define GLSURFACE_TRIANGLEVIEW_H

#include "Color.h"
#include "GlSurface.h"
#include "Shader.h"
#include "VertexArray.h"
#include "VertexBuffer.h"

#include <array>
#include <memory>

class TriangleView : public GlSurface {
public:
    // Normalized device coordinates: (0, 0) is the center, z stays 0 for a flat triangle.
    static constexpr std::array<float, 9> kVertices = {
        -0.5f, -0.5f, 0.0f, // bottom left
         0.5f, -0.5f, 0.0f, // bottom right
         0.0f,  0.5f, 0.0f  // top
    };

    static constexpr VertexAttribute kPositionAttribute = VertexAttribute::packedFloats(0, 3);

    // Deep green.
    static constexpr float kClearColor[4] = {0.2f, 0.3f, 0.3f, 1.0f};

    static constexpr float kTriangleColor[4] = {1.0f, 0.5f, 0.2f, 1.0f};

    // Hue turns per second when animating.
    static constexpr float kHueSpeed = 0.15f;

    explicit TriangleView(const SurfaceConfig& config);
    ~TriangleView() override;

    static Color4 animatedClearColor(double seconds);

protected:
    void onInitialized() override;
    void onDraw() override;
    void onShutdown() override;

private:
    std::unique_ptr<VertexBuffer> vbo_;
    std::unique_ptr<VertexArray>  vao_;
    std::unique_ptr<Shader>       shader_;
};

#endif
