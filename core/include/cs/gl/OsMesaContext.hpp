#pragma once
#include "cs/gl/GlContext.hpp"

#ifdef CS_HAS_OSMESA

#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>

namespace cs {

// Headless software context. It has no window, so pollEvents() only
// returns events queued with pushEvent().
class OsMesaContext : public GlContext {
public:
  OsMesaContext();
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;
  std::vector<InputEvent> pollEvents() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  // Scripted input for headless runs.
  void pushEvent(const InputEvent& e) { scripted_.push_back(e); }

private:
  void release();

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> framebuf_;
  std::vector<InputEvent> scripted_;
};

} // namespace cs

#endif // CS_HAS_OSMESA
