#include <gtest/gtest.h>

#include "glsurface/GlLoader.h"
#include "glsurface/GlSurface.h"
#include "glsurface/Shader.h"
#include "glsurface/TriangleView.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// These tests need a display. Without one they are skipped.

namespace {

WindowConfig hiddenWindow() {
  WindowConfig cfg;
  cfg.title   = "glsurface tests";
  cfg.width   = 64;
  cfg.height  = 64;
  cfg.visible = false;
  return cfg;
}

bool glContextAvailable() {
  static const bool available = [] {
    try {
      GlfwWindow window(hiddenWindow());
      loadGlFunctions();
      return true;
    } catch (const std::runtime_error& e) {
      std::cerr << "No OpenGL context: " << e.what() << std::endl;
      return false;
    }
  }();
  return available;
}

// Every context used here is fresh, so live objects have small names.
bool anyShaderObjectAlive() {
  for (GLuint id = 1; id <= 256; ++id) {
    if (glIsShader(id) || glIsProgram(id)) return true;
  }
  return false;
}

const char* kVertexOk =
    "#version 330 core\n"
    "layout(location = 0) in vec3 aPosition;\n"
    "void main() { gl_Position = vec4(aPosition, 1.0); }\n";

const char* kFragmentOk =
    "#version 330 core\n"
    "out vec4 outputColor;\n"
    "void main() { outputColor = vec4(1.0); }\n";

const char* kBroken =
    "#version 330 core\n"
    "void main() { this is not glsl }\n";

// Reads an input the vertex stage never writes.
const char* kFragmentUnmatched =
    "#version 330 core\n"
    "in vec3 vColor;\n"
    "out vec4 outputColor;\n"
    "void main() { outputColor = vec4(vColor, 1.0); }\n";

class ShaderCompile : public ::testing::Test {
protected:
  void SetUp() override {
    if (!glContextAvailable()) {
      GTEST_SKIP() << "no OpenGL context";
    }
    window_ = std::make_unique<GlfwWindow>(hiddenWindow());
    loadGlFunctions();
  }

  std::unique_ptr<GlfwWindow> window_;
};

std::string errorOf(const char* vs, const char* fs) {
  try {
    Shader shader(vs, fs);
  } catch (const ShaderError& e) {
    return e.what();
  }
  return {};
}

class RecordingSurface : public GlSurface {
public:
  using GlSurface::GlSurface;

  int  initialized = 0;
  int  draws = 0;
  int  shutdowns = 0;
  bool contextAtShutdown = false;

protected:
  void onInitialized() override { ++initialized; }

  void onDraw() override {
    ++draws;
    glClearColor(0.2f, 0.3f, 0.3f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
  }

  void onShutdown() override {
    ++shutdowns;
    contextAtShutdown = glfwGetCurrentContext() != nullptr;
  }
};

} // namespace

TEST_F(ShaderCompile, BundledProgramLinks) {
  {
    Shader shader = Shader::fromFiles(GLSURFACE_SHADER_DIR "/shader.vert",
                                      GLSURFACE_SHADER_DIR "/shader.frag");
    EXPECT_NE(shader.id(), 0u);
    EXPECT_GE(shader.uniformLocation("uColor"), 0);
    EXPECT_EQ(shader.uniformLocation("missing"), -1);
    shader.use();
    shader.setVec4("uColor", Color4(1.0f, 0.5f, 0.2f, 1.0f));
    shader.setVec4("missing", Color4(0.0f));
    EXPECT_EQ(glGetError(), GLenum(GL_NO_ERROR));
    glUseProgram(0);
  }
  EXPECT_FALSE(anyShaderObjectAlive());
}

TEST_F(ShaderCompile, VertexErrorNamesStage) {
  std::string what = errorOf(kBroken, kFragmentOk);
  EXPECT_NE(what.find("compile error (vertex)"), std::string::npos) << what;
  EXPECT_GT(what.size(), std::string("Shader compile error (vertex):\n").size());
  EXPECT_FALSE(anyShaderObjectAlive());
}

TEST_F(ShaderCompile, FragmentErrorReleasesVertexStage) {
  std::string what = errorOf(kVertexOk, kBroken);
  EXPECT_NE(what.find("compile error (fragment)"), std::string::npos) << what;
  EXPECT_FALSE(anyShaderObjectAlive());
}

TEST_F(ShaderCompile, LinkErrorReleasesProgram) {
  std::string what = errorOf(kVertexOk, kFragmentUnmatched);
  EXPECT_NE(what.find("Program link error"), std::string::npos) << what;
  EXPECT_FALSE(anyShaderObjectAlive());
  EXPECT_EQ(glGetError(), GLenum(GL_NO_ERROR));
}

TEST(SurfaceLifecycle, FrameLimitStopsStaticSurface) {
  if (!glContextAvailable()) GTEST_SKIP() << "no OpenGL context";

  SurfaceConfig cfg;
  cfg.window    = hiddenWindow();
  cfg.maxFrames = 3;

  RecordingSurface surface(cfg);
  EXPECT_EQ(surface.run(), 0);
  EXPECT_EQ(surface.initialized, 1);
  EXPECT_EQ(surface.draws, 3);
  EXPECT_EQ(surface.framesDrawn(), 3);
  EXPECT_EQ(surface.shutdowns, 1);
  EXPECT_TRUE(surface.contextAtShutdown);
}

TEST(SurfaceLifecycle, ScreenshotStopsAfterFirstFrame) {
  if (!glContextAvailable()) GTEST_SKIP() << "no OpenGL context";

  SurfaceConfig cfg;
  cfg.window         = hiddenWindow();
  cfg.screenshotPath = ::testing::TempDir() + "glsurface_capture.png";

  RecordingSurface surface(cfg);
  EXPECT_EQ(surface.run(), 0);
  EXPECT_EQ(surface.draws, 1);
  EXPECT_EQ(surface.shutdowns, 1);

  std::ifstream in(cfg.screenshotPath, std::ios::binary);
  ASSERT_TRUE(in);
  char signature[4] = {};
  in.read(signature, 4);
  EXPECT_EQ(std::string(signature + 1, 3), "PNG");
  in.close();
  std::remove(cfg.screenshotPath.c_str());
}

TEST(SurfaceLifecycle, TriangleViewRunsWithBundledShaders) {
  if (!glContextAvailable()) GTEST_SKIP() << "no OpenGL context";

  SurfaceConfig cfg;
  cfg.window    = hiddenWindow();
  cfg.maxFrames = 2;

  TriangleView view(cfg);
  EXPECT_EQ(view.run(), 0);
  EXPECT_EQ(view.framesDrawn(), 2);
}
