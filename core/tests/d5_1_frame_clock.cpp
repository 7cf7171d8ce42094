// D5.1: Frame clock
// Tests:
//   1. elapsed() is monotonic
//   2. waitForNextFrame() paces to at least the frame budget
//   3. An overrun frame is not caught up

#include "cs/engine/FrameClock.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: monotonic ---
  {
    cs::FrameClock clock(60.0);
    clock.start();
    double prev = clock.elapsed();
    requireTrue(prev >= 0.0, "non-negative after start");
    for (int i = 0; i < 1000; i++) {
      double t = clock.elapsed();
      requireTrue(t >= prev, "never decreases");
      prev = t;
    }
    std::printf("  Test 1 (monotonic): PASS\n");
  }

  // --- Test 2: pacing ---
  {
    cs::FrameClock clock(100.0);
    requireTrue(clock.frameBudget() == 0.01, "budget = 1/rate");
    clock.start();
    for (int i = 0; i < 5; i++) clock.waitForNextFrame();
    requireTrue(clock.elapsed() >= 0.049, "five frames take at least five budgets");
    std::printf("  Test 2 (pacing): PASS\n");
  }

  // --- Test 3: overrun ---
  {
    cs::FrameClock clock(100.0);
    clock.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    double before = clock.elapsed();
    clock.waitForNextFrame();   // already late: returns at once
    clock.waitForNextFrame();   // paced from the late boundary
    double after = clock.elapsed();
    requireTrue(after - before >= 0.009, "next frame waits a full budget after overrun");
    std::printf("  Test 3 (overrun): PASS\n");
  }

  // --- Test 4: invalid rate falls back ---
  {
    cs::FrameClock clock(0.0);
    requireTrue(clock.frameRate() == 60.0, "fallback rate");
    std::printf("  Test 4 (invalid rate): PASS\n");
  }

  std::printf("D5.1 frame_clock: ALL PASS\n");
  return 0;
}
