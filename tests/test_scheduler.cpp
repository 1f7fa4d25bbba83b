#include <gtest/gtest.h>

#include "glsurface/FrameScheduler.h"

TEST(FrameScheduler, StaticImageDrawsOnlyWhenInvalidated) {
  FrameScheduler s(0, false);
  EXPECT_FALSE(s.shouldDraw());

  s.invalidate();
  ASSERT_TRUE(s.shouldDraw());
  s.beginFrame();
  s.frameDrawn();

  EXPECT_FALSE(s.shouldDraw());
  EXPECT_FALSE(s.finished());
  EXPECT_EQ(s.framesDrawn(), 1);

  // A resize or an expose event asks for the image again.
  s.invalidate();
  EXPECT_TRUE(s.shouldDraw());
}

TEST(FrameScheduler, FrameLimitKeepsDrawingStaticImage) {
  FrameScheduler s(3, false);
  s.invalidate();

  int draws = 0;
  for (int i = 0; i < 100 && !s.finished(); ++i) {
    if (!s.shouldDraw()) continue;
    s.beginFrame();
    ++draws;
    s.frameDrawn();
  }

  EXPECT_TRUE(s.finished());
  EXPECT_EQ(draws, 3);
  EXPECT_EQ(s.framesDrawn(), 3);
  EXPECT_FALSE(s.shouldDraw());
}

TEST(FrameScheduler, InvalidateDuringDrawSchedulesNextFrame) {
  FrameScheduler s(0, false);
  s.invalidate();
  s.beginFrame();
  s.invalidate(); // animated views re-invalidate from onDraw
  s.frameDrawn();
  EXPECT_TRUE(s.shouldDraw());
}

TEST(FrameScheduler, CaptureStopsAfterFirstFrame) {
  FrameScheduler s(10, true);
  EXPECT_FALSE(s.wantsCapture());

  s.invalidate();
  s.beginFrame();
  s.frameDrawn();

  EXPECT_TRUE(s.wantsCapture());
  EXPECT_TRUE(s.finished());
  EXPECT_FALSE(s.shouldDraw());
}

TEST(FrameScheduler, UnlimitedWithoutCaptureNeverFinishes) {
  FrameScheduler s(0, false);
  for (int i = 0; i < 50; ++i) {
    s.invalidate();
    s.beginFrame();
    s.frameDrawn();
  }
  EXPECT_FALSE(s.finished());
  EXPECT_FALSE(s.wantsCapture());
}
