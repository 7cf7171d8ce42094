#pragma once
#include "cs/scene/CandleItem.hpp"
#include "cs/scene/Drawable.hpp"
#include "cs/scene/FrameContext.hpp"
#include "cs/style/Color.hpp"

namespace cs {

// Colours are filled from the active Theme by EngineConfig::candleStyle().
struct CandleStyle {
  Rgb colorUp;
  Rgb colorDown;
  Rgb outlineColor;
  float outlineWidthPx{2.0f};
  float noiseStrength{0.25f};  // 0 = flat body colour
};

// Composite drawable: a filled body plus an outline expanded from the
// same footprint by a geometry shader. Render order: outline, then fill.
class Candle {
public:
  Candle(const CandleItem& item, const CandleStyle& style);

  static DrawableSpec fillSpec();
  static DrawableSpec outlineSpec();

  bool create();
  void update(const FrameContext& ctx);
  void render(Stats& stats) const;

  const CandleItem& item() const { return item_; }
  const CandleStyle& style() const { return style_; }
  Rgb bodyColor() const { return item_.polarity ? style_.colorUp : style_.colorDown; }

private:
  // Uniforms shared by the common vertex shader
  struct TransformLocs {
    GLint position{-1};
    GLint scale{-1};
    GLint aspect{-1};
    GLint offset{-1};
  };

  static bool resolveTransform(const Drawable& d, TransformLocs& out);
  void pushTransform(const ShaderProgram& prog, const TransformLocs& locs,
                     const FrameContext& ctx) const;

  CandleItem item_;
  CandleStyle style_;

  Drawable fill_;
  TransformLocs fillXf_;
  GLint fillColor_{-1};
  GLint fillTime_{-1};
  GLint fillNoise_{-1};

  Drawable outline_;
  TransformLocs outlineXf_;
  GLint outlineColor_{-1};
  GLint outlineWidth_{-1};
};

} // namespace cs
