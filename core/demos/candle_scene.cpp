// CandleScene: interactive candlestick scene
// GLFW: continuous 60 Hz loop. Right-drag pans, arrow keys glide, Esc quits.
// OSMesa (or --headless): single frame written as PPM.

#include "cs/engine/Engine.hpp"
#include "cs/engine/EngineConfig.hpp"
#include "cs/export/Snapshot.hpp"
#include "cs/gl/GlContext.hpp"

#ifdef CS_HAS_GLFW
#include "cs/gl/GlfwContext.hpp"
#endif
#ifdef CS_HAS_OSMESA
#include "cs/gl/OsMesaContext.hpp"
#endif

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [--headless] [config.json]\n", argv0);
}

int main(int argc, char** argv) {
  bool headless = false;
  std::string configPath;
  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--headless") == 0) {
      headless = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage(argv[0]);
      return 0;
    } else if (configPath.empty()) {
      configPath = argv[i];
    } else {
      usage(argv[0]);
      return 1;
    }
  }

  cs::EngineConfig config;
  if (!configPath.empty()) {
    std::string err;
    if (!cs::loadEngineConfigFile(configPath, config, err)) {
      std::fprintf(stderr, "Config error: %s\n", err.c_str());
      return 1;
    }
  }

  std::unique_ptr<cs::GlContext> ctx;
#ifdef CS_HAS_GLFW
  if (!headless) ctx = std::make_unique<cs::GlfwContext>(config.window.title);
#endif
#ifdef CS_HAS_OSMESA
  if (!ctx) {
    ctx = std::make_unique<cs::OsMesaContext>();
    headless = true;
  }
#endif
  if (!ctx) {
    std::fprintf(stderr, "No GL context available (built without GLFW and OSMesa)\n");
    return 1;
  }

  cs::Engine engine(config, std::move(ctx));
  if (!engine.init()) {
    std::fprintf(stderr, "Engine init failed\n");
    return 1;
  }

  if (headless) {
    engine.update();
    cs::Stats stats = engine.render();
    std::printf("Rendered: %u draw calls\n", stats.drawCalls);

    auto pixels = engine.context().readPixels();
    if (!cs::writePPMFlipped(config.snapshotPath, pixels,
                             engine.viewport().width(), engine.viewport().height())) {
      return 1;
    }
    std::printf("Wrote %s (%dx%d)\n", config.snapshotPath.c_str(),
                engine.viewport().width(), engine.viewport().height());
    return 0;
  }

  std::printf("Right-drag to pan, arrow keys to glide, Esc to quit\n");
  engine.run();
  std::printf("Exited after %.2f s\n", engine.time());
  return 0;
}
