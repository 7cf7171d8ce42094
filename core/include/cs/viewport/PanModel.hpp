#pragma once
#include "cs/math/Vec2.hpp"
#include "cs/viewport/Viewport.hpp"

#include <optional>

namespace cs {

// Screen offset split into a committed part (finished drags and
// animations) and a floating part (the drag in progress). Shaders read
// total() and never need to know whether a drag is active.
//
// Offsets are fractions of the viewport size scaled by panSpeed, in
// window orientation (Y down).
class PanModel {
public:
  PanModel() = default;
  PanModel(const Viewport& viewport, float panSpeed);

  // No-op while a drag is already active.
  void beginDrag(Vec2 cursorPx);

  // Recompute the floating offset from the anchor. No effect without a drag.
  void dragTick(Vec2 cursorPx);

  // Fold the final delta into the committed offset and clear the anchor.
  // No effect without a drag.
  void endDrag(Vec2 cursorPx);

  // Add directly to the committed offset.
  void nudge(Vec2 delta);

  bool dragging() const { return anchor_.has_value(); }
  Vec2 committed() const { return committed_; }
  Vec2 floating() const { return floating_; }
  Vec2 total() const { return committed_ + floating_; }
  float panSpeed() const { return panSpeed_; }

private:
  Vec2 dragDelta(Vec2 cursorPx) const;

  Viewport viewport_;
  float panSpeed_{2.0f};
  Vec2 committed_;
  Vec2 floating_;
  std::optional<Vec2> anchor_;
};

} // namespace cs
