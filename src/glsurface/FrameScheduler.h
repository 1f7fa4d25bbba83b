#pragma once

// Decides when the surface loop draws and when it stops. Holds no GL state.
class FrameScheduler {
public:
    // maxFrames == 0 means unlimited. With captureFirstFrame the loop stops after one frame.
    FrameScheduler(int maxFrames, bool captureFirstFrame)
    : maxFrames_(maxFrames),
      capture_(captureFirstFrame)
    {}

    void invalidate() { invalidated_ = true; }

    bool shouldDraw() const { return invalidated_ && !finished(); }

    // Call right before drawing. Anything invalidated during the draw schedules the next frame.
    void beginFrame() { invalidated_ = false; }

    void frameDrawn() {
        ++framesDrawn_;
        // A frame limit keeps the loop drawing even when the image is static.
        if (maxFrames_ > 0 && framesDrawn_ < maxFrames_) {
            invalidated_ = true;
        }
    }

    // True right after the first frame when a capture was requested.
    bool wantsCapture() const { return capture_ && framesDrawn_ == 1; }

    bool finished() const {
        if (capture_ && framesDrawn_ >= 1) return true;
        return maxFrames_ > 0 && framesDrawn_ >= maxFrames_;
    }

    int framesDrawn() const { return framesDrawn_; }

private:
    int  maxFrames_   = 0;
    bool capture_     = false;
    bool invalidated_ = false;
    int  framesDrawn_ = 0;
};
