#pragma once
#include "cs/scene/Drawable.hpp"
#include "cs/scene/FrameContext.hpp"
#include "cs/style/Color.hpp"

namespace cs {

struct BackgroundParams {
  float radiusBase{0.6f};       // clip units (vertical)
  float radiusAmplitude{0.15f};
  float radiusOmega{1.5f};      // rad/s
  float falloff{0.85f};         // attenuation at and beyond the radius
};

// radius = base + amplitude * sin(time * omega), never below a tiny epsilon.
float vignetteRadius(const BackgroundParams& p, double time);

// 1 at the cursor, falling linearly to (1 - falloff) at the radius.
// distance / radius is clamped to [0,1].
float vignetteAttenuation(const BackgroundParams& p, float distance, double time);

// Fullscreen quad behind everything (far depth plane) with a radial
// vignette centered on the cursor.
class Background {
public:
  Background(const Rgb& tint, const BackgroundParams& params);

  static DrawableSpec spec();

  bool create();
  void update(const FrameContext& ctx);
  void render(Stats& stats) const;

  const BackgroundParams& params() const { return params_; }
  const Rgb& tint() const { return tint_; }

private:
  Rgb tint_;
  BackgroundParams params_;

  Drawable quad_;
  GLint cursor_{-1};
  GLint aspect_{-1};
  GLint time_{-1};
  GLint tintLoc_{-1};
  GLint radiusBase_{-1};
  GLint radiusAmp_{-1};
  GLint radiusOmega_{-1};
  GLint falloff_{-1};
};

} // namespace cs
