#pragma once
#include "cs/debug/Stats.hpp"
#include "cs/scene/Scene.hpp"
#include "cs/style/Color.hpp"
#include "cs/viewport/Viewport.hpp"
#include <glad/gl.h>

namespace cs {

class Renderer {
public:
  // Check the context and set fixed GL state. Call once after the GL
  // context is current.
  bool init();

  // Clear colour + depth, then walk the scene in order.
  Stats render(const Scene& scene, const Viewport& viewport, const Rgb& clearColor);

private:
  bool inited_{false};
};

} // namespace cs
