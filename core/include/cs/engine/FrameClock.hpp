#pragma once
#include <chrono>

namespace cs {

// Monotonic time source plus best-effort frame pacing. A frame that
// overruns its budget restarts the schedule from "now"; late frames are
// never caught up.
class FrameClock {
public:
  using Clock = std::chrono::steady_clock;

  explicit FrameClock(double frameRate = 60.0);

  // Reset t=0 and the frame schedule to now.
  void start();

  // Seconds since start().
  double elapsed() const;

  // Block until one frame budget has passed since the previous frame
  // boundary.
  void waitForNextFrame();

  double frameRate() const { return frameRate_; }
  double frameBudget() const;

private:
  double frameRate_;
  Clock::duration budget_;
  Clock::time_point start_;
  Clock::time_point frameStart_;
};

} // namespace cs
