#ifndef GLSURFACE_GLSURFACE_H
#define GLSURFACE_GLSURFACE_H

#include "Config.h"
#include "FrameScheduler.h"
#include "GlfwWindow.h"

#include <memory>

// A window with a current GL context and a fixed lifecycle:
// onInitialized once, then onResize/onDraw as needed, then onShutdown.
class GlSurface {
public:
    explicit GlSurface(const SurfaceConfig& config);
    virtual ~GlSurface();

    GlSurface(const GlSurface&) = delete;
    GlSurface& operator=(const GlSurface&) = delete;

    // Blocks until the window closes, Escape is pressed, the frame limit is hit
    // or the requested capture is written.
    int run();

    // Request another onDraw on the next loop iteration.
    void invalidate() { scheduler_.invalidate(); }

    int framesDrawn() const { return scheduler_.framesDrawn(); }

protected:
    virtual void onInitialized() {}
    virtual void onResize(int width, int height);
    virtual void onDraw() = 0;
    virtual void onShutdown() {}

    const SurfaceConfig& config() const { return config_; }

    // Seconds since run() started.
    double elapsedSeconds() const;

private:
    SurfaceConfig config_;
    std::unique_ptr<GlfwWindow> window_;

    FrameScheduler scheduler_;
    double startTime_ = 0.0;

    void captureFrame(const std::string& path) const;
};

#endif
