#ifdef CS_HAS_OSMESA

#include "cs/gl/OsMesaContext.hpp"
#include <cstdio>

namespace cs {

OsMesaContext::OsMesaContext() = default;

OsMesaContext::~OsMesaContext() {
  release();
}

void OsMesaContext::release() {
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
  }
}

bool OsMesaContext::init(int width, int height) {
  if (ctx_) {
    std::fprintf(stderr, "OsMesaContext: already initialized\n");
    return false;
  }
  if (width <= 0 || height <= 0) {
    std::fprintf(stderr, "OsMesaContext: invalid size %dx%d\n", width, height);
    return false;
  }

  // Candle outlines use a geometry shader: ask for 3.3 core.
  static const int attribs[] = {
    OSMESA_FORMAT,                OSMESA_RGBA,
    OSMESA_DEPTH_BITS,            24,
    OSMESA_STENCIL_BITS,          0,
    OSMESA_PROFILE,               OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext: no 3.3 core context available\n");
    return false;
  }

  framebuf_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4, 0);
  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width, height)) {
    std::fprintf(stderr, "OsMesaContext: cannot bind %dx%d framebuffer\n", width, height);
    release();
    return false;
  }

  if (!gladLoadGL((GLADloadfunc)OSMesaGetProcAddress)) {
    std::fprintf(stderr, "OsMesaContext: cannot load GL entry points\n");
    release();
    return false;
  }

  width_ = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  // No front buffer: make sure the frame has landed in framebuf_.
  glFinish();
}

std::vector<InputEvent> OsMesaContext::pollEvents() {
  std::vector<InputEvent> out;
  out.swap(scripted_);
  return out;
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(framebuf_.size());
  if (!ctx_) return pixels;
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

} // namespace cs

#endif // CS_HAS_OSMESA
