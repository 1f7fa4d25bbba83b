#include "GlSurface.h"

#include "GlErrors.h"
#include "GlLoader.h"
#include "PngWriter.h"

#include <cstdint>
#include <iostream>
#include <vector>

GlSurface::GlSurface(const SurfaceConfig& config)
: config_(config),
  window_(std::make_unique<GlfwWindow>(config.window)),
  scheduler_(config.maxFrames, !config.screenshotPath.empty())
{
}

GlSurface::~GlSurface() = default;

void GlSurface::onResize(int width, int height) {
    glViewport(0, 0, width, height);
}

double GlSurface::elapsedSeconds() const {
    return glfwGetTime() - startTime_;
}

int GlSurface::run() {
    loadGlFunctions();
    logGlInfo();
    startTime_ = glfwGetTime();

    onInitialized();
    checkGlErrors("initialization");

    onResize(window_->framebufferWidth(), window_->framebufferHeight());
    invalidate();

    while (!window_->shouldClose() && !scheduler_.finished()) {
        window_->pollEvents();

        if (window_->consumeResize()) {
            onResize(window_->framebufferWidth(), window_->framebufferHeight());
            invalidate();
        }
        if (window_->consumeRefresh()) {
            invalidate();
        }

        if (!scheduler_.shouldDraw()) {
            glfwWaitEventsTimeout(0.1);
            continue;
        }

        scheduler_.beginFrame();
        onDraw();
        scheduler_.frameDrawn();

        if (scheduler_.wantsCapture()) {
            captureFrame(config_.screenshotPath);
            std::cout << "Saved " << config_.screenshotPath << std::endl;
        }

        window_->swapBuffers();
    }

    onShutdown();
    checkGlErrors("shutdown");
    return 0;
}

void GlSurface::captureFrame(const std::string& path) const {
    const int width  = window_->framebufferWidth();
    const int height = window_->framebufferHeight();

    std::vector<std::uint8_t> pixels(std::size_t(width) * std::size_t(height) * 4);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadBuffer(GL_BACK);
    glReadPixels(0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
    checkGlErrors("frame capture");

    flipRows(pixels, width, height);
    writePng(path, width, height, pixels);
}
