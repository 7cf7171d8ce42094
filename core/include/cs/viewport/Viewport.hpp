#pragma once
#include "cs/math/Vec2.hpp"

namespace cs {

// Fixed-size pixel viewport. Resize is not supported, so the size is
// set once at construction.
class Viewport {
public:
  Viewport() = default;
  Viewport(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  Vec2 size() const;

  float aspectRatio() const;

  // Coordinate mapping (pixels: origin top-left, Y down; clip: [-1,1], Y up)
  Vec2 pixelToClip(Vec2 px) const;

  // Pixel delta as a fraction of the viewport size (no Y flip).
  Vec2 normalizeDelta(Vec2 dpx) const;

  // Convert a length in pixels to vertical clip units.
  float pixelsToClipHeight(float px) const;

private:
  int width_{800};
  int height_{600};
};

} // namespace cs
