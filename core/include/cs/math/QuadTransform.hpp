#pragma once
#include "cs/math/Vec2.hpp"

namespace cs {

// CPU mirror of the candle vertex shader (kCandleVert in Candle.cpp).
//
//   screen = (local * scale + position) / (aspect, 1) + offset * (1, -1)
//
// `local` is a corner of the centered unit quad (components +-0.5).
// Scale and position live in a space that is vertically unit and
// horizontally aspect-normalized; only X is divided by the aspect ratio.
// Offset Y is flipped because pan offsets are measured in window pixels
// (Y down) while clip space is Y up.
inline Vec2 quadToClip(Vec2 local, Vec2 scale, Vec2 position,
                       float aspect, Vec2 offset) {
  Vec2 p = mul(local, scale) + position;
  return {p.x / aspect + offset.x, p.y - offset.y};
}

} // namespace cs
