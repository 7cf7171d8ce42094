#include "cs/viewport/Viewport.hpp"

namespace cs {

Viewport::Viewport(int width, int height)
  : width_(width > 0 ? width : 1), height_(height > 0 ? height : 1) {}

Vec2 Viewport::size() const {
  return {static_cast<float>(width_), static_cast<float>(height_)};
}

float Viewport::aspectRatio() const {
  return static_cast<float>(width_) / static_cast<float>(height_);
}

Vec2 Viewport::pixelToClip(Vec2 px) const {
  float cx = px.x / static_cast<float>(width_) * 2.0f - 1.0f;
  float cy = 1.0f - px.y / static_cast<float>(height_) * 2.0f; // Y flipped
  return {cx, cy};
}

Vec2 Viewport::normalizeDelta(Vec2 dpx) const {
  return div(dpx, size());
}

float Viewport::pixelsToClipHeight(float px) const {
  return px * 2.0f / static_cast<float>(height_);
}

} // namespace cs
