#pragma once
#include <cstdint>

namespace cs {

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint32_t drawCalls = 0;

  // Animation entries applied this tick
  std::uint32_t activeAnimations = 0;

  std::uint64_t frameIndex = 0;
};

} // namespace cs
