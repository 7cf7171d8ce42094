#pragma once
#include "cs/gl/GlContext.hpp"

#ifdef CS_HAS_GLFW

#include <string>

struct GLFWwindow;

namespace cs {

class GlfwContext : public GlContext {
public:
  explicit GlfwContext(std::string title = "CandleScene");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  // Pumps the GLFW queue; a close request is reported as a Quit event.
  std::vector<InputEvent> pollEvents() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

private:
  std::string title_;
  GLFWwindow* window_{nullptr};
  bool glfwReady_{false};
  int width_{0};
  int height_{0};

  // Framebuffer pixels per window coordinate, per axis.
  void framebufferScale(double& sx, double& sy) const;

  // Filled by callbacks, drained by pollEvents()
  std::vector<InputEvent> pending_;
  double lastCursorX_{0};  // framebuffer pixels
  double lastCursorY_{0};

  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
};

} // namespace cs

#endif // CS_HAS_GLFW
