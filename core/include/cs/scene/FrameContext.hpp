#pragma once
#include "cs/math/Vec2.hpp"
#include "cs/viewport/Viewport.hpp"

namespace cs {

// Read-only per-tick state handed to every drawable's update().
struct FrameContext {
  double time{0};      // seconds since engine start
  Vec2 cursorPx;       // window pixels, origin top-left
  Vec2 panOffset;      // committed + floating
  Viewport viewport;
};

} // namespace cs
