#pragma once
#include "cs/viewport/InputState.hpp"

#include <cstdint>
#include <vector>

namespace cs {

// Owns the GL context (and window, if any). Created once at startup and
// owned by the Engine; the destructor tears the context down on every
// exit path, including a failed init().
class GlContext {
public:
  virtual ~GlContext() = default;

  // Create a GL 3.3 core context and load function pointers.
  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  // Drain input events gathered since the last call.
  virtual std::vector<InputEvent> pollEvents() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA pixels from the framebuffer (origin bottom-left).
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace cs
