#include "cs/engine/FrameClock.hpp"
#include <thread>

namespace cs {

FrameClock::FrameClock(double frameRate)
  : frameRate_(frameRate > 0.0 ? frameRate : 60.0),
    budget_(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / frameRate_))),
    start_(Clock::now()),
    frameStart_(start_) {}

void FrameClock::start() {
  start_ = Clock::now();
  frameStart_ = start_;
}

double FrameClock::elapsed() const {
  return std::chrono::duration<double>(Clock::now() - start_).count();
}

double FrameClock::frameBudget() const {
  return 1.0 / frameRate_;
}

void FrameClock::waitForNextFrame() {
  auto deadline = frameStart_ + budget_;
  auto now = Clock::now();
  if (now < deadline) {
    std::this_thread::sleep_until(deadline);
    frameStart_ = deadline;
  } else {
    frameStart_ = now;
  }
}

} // namespace cs
