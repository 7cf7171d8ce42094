#include "cs/gl/Renderer.hpp"
#include <cstdio>

namespace cs {

bool Renderer::init() {
  GLint major = 0, minor = 0;
  glGetIntegerv(GL_MAJOR_VERSION, &major);
  glGetIntegerv(GL_MINOR_VERSION, &minor);
  if (major < 3 || (major == 3 && minor < 2)) {
    std::fprintf(stderr, "Renderer::init: GL %d.%d lacks geometry shaders (need 3.2+)\n",
                 major, minor);
    return false;
  }

  // Equal depth passes so later items draw over earlier ones at the same
  // depth; the background sits on the far plane and only fills the gaps.
  glEnable(GL_DEPTH_TEST);
  glDepthFunc(GL_LEQUAL);

  // Outline quads from the geometry shader have mixed winding.
  glDisable(GL_CULL_FACE);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  inited_ = true;
  return true;
}

Stats Renderer::render(const Scene& scene, const Viewport& viewport, const Rgb& clearColor) {
  Stats stats{};
  if (!inited_) return stats;

  glViewport(0, 0, viewport.width(), viewport.height());
  glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

  scene.render(stats);
  return stats;
}

} // namespace cs
