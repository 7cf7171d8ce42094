#include "cs/viewport/PanModel.hpp"

namespace cs {

PanModel::PanModel(const Viewport& viewport, float panSpeed)
  : viewport_(viewport), panSpeed_(panSpeed) {}

Vec2 PanModel::dragDelta(Vec2 cursorPx) const {
  return viewport_.normalizeDelta(cursorPx - *anchor_) * panSpeed_;
}

void PanModel::beginDrag(Vec2 cursorPx) {
  if (anchor_) return;
  anchor_ = cursorPx;
  floating_ = {};
}

void PanModel::dragTick(Vec2 cursorPx) {
  if (!anchor_) return;
  floating_ = dragDelta(cursorPx);
}

void PanModel::endDrag(Vec2 cursorPx) {
  if (!anchor_) return;
  committed_ += dragDelta(cursorPx);
  floating_ = {};
  anchor_.reset();
}

void PanModel::nudge(Vec2 delta) {
  committed_ += delta;
}

} // namespace cs
