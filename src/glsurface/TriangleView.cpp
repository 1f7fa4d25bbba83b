#include "TriangleView.h"

#include <iostream>

TriangleView::TriangleView(const SurfaceConfig& config)
: GlSurface(config)
{
}

TriangleView::~TriangleView() = default;

Color4 TriangleView::animatedClearColor(double seconds) {
    return fromHsv(hueAt(seconds, kHueSpeed), 0.75f, 0.75f, 1.0f);
}

void TriangleView::onInitialized() {
    glClearColor(kClearColor[0], kClearColor[1], kClearColor[2], kClearColor[3]);

    // 1) Upload the three vertices. They never change after this.
    vbo_ = std::make_unique<VertexBuffer>(kVertices.data(),
                                          GLsizeiptr(kVertices.size() * sizeof(float)),
                                          GL_STATIC_DRAW);

    // 2) Describe the buffer layout: slot 0 reads 3 floats per vertex.
    //    The VBO is still bound, so the attribute sources from it.
    vao_ = std::make_unique<VertexArray>();
    vao_->bind();
    vao_->setAttribute(kPositionAttribute);

    // 3) Compile and link the program, then make it current.
    const SurfaceConfig& cfg = config();
    std::cout << "Loading shaders from " << cfg.vertexShaderPath()
              << " and " << cfg.fragmentShaderPath() << std::endl;
    shader_ = std::make_unique<Shader>(
        Shader::fromFiles(cfg.vertexShaderPath(), cfg.fragmentShaderPath()));
    shader_->use();
    shader_->setVec4("uColor", Color4(kTriangleColor[0], kTriangleColor[1],
                                      kTriangleColor[2], kTriangleColor[3]));
}

void TriangleView::onDraw() {
    if (config().animate) {
        Color4 c = animatedClearColor(elapsedSeconds());
        glClearColor(c.r, c.g, c.b, c.a);
    }
    glClear(GL_COLOR_BUFFER_BIT);

    shader_->use();
    vao_->bind();
    glDrawArrays(GL_TRIANGLES, 0, GLsizei(kVertices.size() / 3));

    if (config().animate) {
        invalidate();
    }
}

void TriangleView::onShutdown() {
    // Release GL objects while the context is still current.
    shader_.reset();
    vao_.reset();
    vbo_.reset();
}
