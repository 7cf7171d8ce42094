#pragma once
#include "cs/math/Vec2.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cs {

class PanModel;

enum class AnimationKind : std::uint8_t {
  PanBy
};

inline const char* toString(AnimationKind k) {
  switch (k) {
    case AnimationKind::PanBy: return "panBy";
    default: return "unknown";
  }
}

// How a command's delta is applied each tick.
//   PerTick: the delta is added once per tick regardless of frame time.
//            Total displacement depends on the achieved tick rate.
//   Scaled:  the delta is multiplied by dt * nominalRate, so the total
//            displacement over the window tracks wall-clock time.
enum class AnimationStepMode : std::uint8_t {
  PerTick,
  Scaled
};

struct AnimationCommand {
  AnimationKind kind{AnimationKind::PanBy};
  Vec2 delta;  // PanBy: committed-offset step
};

inline AnimationCommand panBy(float dx, float dy) {
  return {AnimationKind::PanBy, {dx, dy}};
}

struct AnimationEntry {
  AnimationCommand command;
  double expiry{0};  // seconds, same clock as tick(now)
};

// Time-gated deferred mutations. Single-threaded: entries are applied in
// insertion order inside tick(). Growth is unbounded; entries only leave
// by expiring.
class AnimationQueue {
public:
  void setStepMode(AnimationStepMode mode, double nominalRate);
  AnimationStepMode stepMode() const { return mode_; }

  // Append {command, now + duration}. Identical commands are not merged.
  void enqueue(const AnimationCommand& command, double now, double duration);

  // Drop entries with expiry <= now, then apply every survivor once.
  // `dt` is the measured time since the previous tick (Scaled mode only).
  // Returns the number of entries applied.
  std::size_t tick(double now, double dt, PanModel& pan);

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<AnimationEntry>& entries() const { return entries_; }

  void clear();

private:
  void apply(const AnimationCommand& cmd, double dt, PanModel& pan) const;

  std::vector<AnimationEntry> entries_;
  AnimationStepMode mode_{AnimationStepMode::PerTick};
  double nominalRate_{60.0};
};

} // namespace cs
