#pragma once
#include "cs/anim/AnimationQueue.hpp"
#include "cs/data/CandleSeries.hpp"
#include "cs/scene/Background.hpp"
#include "cs/scene/Candle.hpp"
#include "cs/scene/CandleItem.hpp"
#include "cs/style/Theme.hpp"

#include <string>
#include <vector>

namespace cs {

struct WindowConfig {
  int width{1600};
  int height{900};
  std::string title{"CandleScene"};
};

struct AnimationConfig {
  double duration{2.0};  // seconds per arrow-key press
  float step{0.005f};    // committed-offset delta per tick at the nominal rate
  AnimationStepMode stepMode{AnimationStepMode::PerTick};
};

struct EngineConfig {
  WindowConfig window;
  double frameRate{60.0};
  float panSpeed{2.0f};
  AnimationConfig animation;

  float outlineWidthPx{2.0f};
  float noiseStrength{0.25f};
  BackgroundParams background;
  Theme theme{darkTheme()};

  // Explicit candles; when empty a series is generated from `series`.
  std::vector<CandleItem> candles;
  SeriesConfig series;

  // Headless runs write their single frame here.
  std::string snapshotPath{"candle_scene.ppm"};

  CandleStyle candleStyle() const;
};

// Parse a JSON config document on top of `out` (missing keys keep their
// current values). Returns false with a message in `err` on malformed
// JSON, wrong value types, out-of-range values or bad "#RRGGBB" colours.
bool parseEngineConfig(const std::string& json, EngineConfig& out, std::string& err);

// Read `path` and parse it with parseEngineConfig.
bool loadEngineConfigFile(const std::string& path, EngineConfig& out, std::string& err);

} // namespace cs
