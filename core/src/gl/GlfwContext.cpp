#ifdef CS_HAS_GLFW

#include "cs/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>
#include <utility>

namespace cs {

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  if (glfwReady_) {
    glfwTerminate();
  }
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }
  glfwReady_ = true;

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
  glfwWindowHint(GLFW_DEPTH_BITS, 24);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    return false;
  }

  glfwMakeContextCurrent(window_);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);

  // Initialize cursor position
  double cx = 0.0, cy = 0.0;
  glfwGetCursorPos(window_, &cx, &cy);
  double sx = 1.0, sy = 1.0;
  framebufferScale(sx, sy);
  lastCursorX_ = cx * sx;
  lastCursorY_ = cy * sy;

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

void GlfwContext::framebufferScale(double& sx, double& sy) const {
  sx = 1.0;
  sy = 1.0;
  if (!window_) return;

  int ww = 0, wh = 0, fw = 0, fh = 0;
  glfwGetWindowSize(window_, &ww, &wh);
  glfwGetFramebufferSize(window_, &fw, &fh);
  // Minimized windows report 0x0
  if (ww > 0 && wh > 0 && fw > 0 && fh > 0) {
    sx = static_cast<double>(fw) / ww;
    sy = static_cast<double>(fh) / wh;
  }
}

std::vector<InputEvent> GlfwContext::pollEvents() {
  glfwPollEvents();

  if (window_ && glfwWindowShouldClose(window_)) {
    pending_.push_back(quitEvent());
  }

  std::vector<InputEvent> out;
  out.swap(pending_);
  return out;
}

static KeyCode mapKey(int key) {
  switch (key) {
    case GLFW_KEY_ESCAPE: return KeyCode::Escape;
    case GLFW_KEY_LEFT:   return KeyCode::Left;
    case GLFW_KEY_RIGHT:  return KeyCode::Right;
    case GLFW_KEY_UP:     return KeyCode::Up;
    case GLFW_KEY_DOWN:   return KeyCode::Down;
    default:              return KeyCode::None;
  }
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || action != GLFW_PRESS) return;

  KeyCode code = mapKey(key);
  if (code != KeyCode::None) self->pending_.push_back(keyEvent(code));
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  // GLFW reports window coordinates; Viewport works in framebuffer pixels.
  double sx = 1.0, sy = 1.0;
  self->framebufferScale(sx, sy);
  InputEvent e = toFramebufferPixels(cursorEvent(x, y), sx, sy);
  self->lastCursorX_ = e.x;
  self->lastCursorY_ = e.y;
  self->pending_.push_back(e);
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  MouseButton mb;
  if (button == GLFW_MOUSE_BUTTON_LEFT) mb = MouseButton::Left;
  else if (button == GLFW_MOUSE_BUTTON_RIGHT) mb = MouseButton::Right;
  else if (button == GLFW_MOUSE_BUTTON_MIDDLE) mb = MouseButton::Middle;
  else return;

  InputEventType type = (action == GLFW_PRESS) ? InputEventType::MouseDown
                                               : InputEventType::MouseUp;
  self->pending_.push_back(mouseEvent(type, mb, self->lastCursorX_, self->lastCursorY_));
}

} // namespace cs

#endif // CS_HAS_GLFW
