#pragma once
#include "cs/math/Vec2.hpp"

#include <array>

namespace cs {

// Chart-space description of one candle. Scale is the full width and
// height. "Top" is the smaller Y. Derived corners are recomputed on
// every call and never cached.
struct CandleItem {
  Vec2 position;       // center
  Vec2 scale{0.1f, 0.1f};
  bool polarity{true}; // true = up (close >= open)

  Vec2 topLeft() const { return position - scale / 2.0f; }
  Vec2 bottomRight() const { return position + scale / 2.0f; }
  Vec2 bottomLeft() const { return {topLeft().x, bottomRight().y}; }
  Vec2 topRight() const { return {bottomRight().x, topLeft().y}; }

  // Open/close diagonal: bottom-left -> top-right when up,
  // top-left -> bottom-right when down.
  Vec2 startPosition() const { return polarity ? bottomLeft() : topLeft(); }
  Vec2 endPosition() const { return polarity ? topRight() : bottomRight(); }
};

// Footprint corners before the clip transform, in the order the GPU
// sees them. Both come from the shared quad mesh scaled to the centered
// unit quad, so their corner sets match.
std::array<Vec2, 4> fillCorners(const CandleItem& item);
std::array<Vec2, 4> outlineCorners(const CandleItem& item);

} // namespace cs
