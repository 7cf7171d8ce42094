#include "cs/anim/AnimationQueue.hpp"
#include "cs/viewport/PanModel.hpp"

#include <algorithm>

namespace cs {

void AnimationQueue::setStepMode(AnimationStepMode mode, double nominalRate) {
  mode_ = mode;
  nominalRate_ = nominalRate;
}

void AnimationQueue::enqueue(const AnimationCommand& command, double now, double duration) {
  entries_.push_back({command, now + duration});
}

std::size_t AnimationQueue::tick(double now, double dt, PanModel& pan) {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [now](const AnimationEntry& e) { return e.expiry <= now; }),
                 entries_.end());

  for (const auto& e : entries_) {
    apply(e.command, dt, pan);
  }
  return entries_.size();
}

void AnimationQueue::apply(const AnimationCommand& cmd, double dt, PanModel& pan) const {
  float factor = 1.0f;
  if (mode_ == AnimationStepMode::Scaled) {
    factor = static_cast<float>(dt * nominalRate_);
  }

  switch (cmd.kind) {
    case AnimationKind::PanBy:
      pan.nudge(cmd.delta * factor);
      break;
  }
}

void AnimationQueue::clear() {
  entries_.clear();
}

} // namespace cs
