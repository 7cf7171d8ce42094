#pragma once
#include <cstdint>

namespace cs {

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, Up, Down, Escape
};

enum class MouseButton : std::uint8_t {
  Left = 0, Right, Middle
};

enum class InputEventType : std::uint8_t {
  Quit,        // window close request
  KeyDown,     // key press (repeats are not reported)
  MouseDown,
  MouseUp,
  CursorMove
};

// Backend-neutral input event
struct InputEvent {
  InputEventType type{InputEventType::CursorMove};
  KeyCode key{KeyCode::None};
  MouseButton button{MouseButton::Left};
  // Pointer position in framebuffer pixels (the unit of Viewport),
  // 0=left/top. Mouse and cursor events only.
  double x{0}, y{0};
};

inline InputEvent quitEvent() {
  InputEvent e;
  e.type = InputEventType::Quit;
  return e;
}

inline InputEvent keyEvent(KeyCode key) {
  InputEvent e;
  e.type = InputEventType::KeyDown;
  e.key = key;
  return e;
}

inline InputEvent mouseEvent(InputEventType type, MouseButton button, double x, double y) {
  InputEvent e;
  e.type = type;
  e.button = button;
  e.x = x;
  e.y = y;
  return e;
}

// Convert a pointer position reported in window (screen) coordinates to
// framebuffer pixels. scale = framebuffer size / window size per axis,
// 2 on a typical HiDPI display.
inline InputEvent toFramebufferPixels(InputEvent e, double scaleX, double scaleY) {
  e.x *= scaleX;
  e.y *= scaleY;
  return e;
}

inline InputEvent cursorEvent(double x, double y) {
  InputEvent e;
  e.type = InputEventType::CursorMove;
  e.x = x;
  e.y = y;
  return e;
}

} // namespace cs
