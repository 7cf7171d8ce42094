#pragma once
#include "cs/scene/CandleItem.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cs {

// Deterministic stand-in chart used when the config lists no candles.
struct SeriesConfig {
  std::size_t count{40};
  std::uint32_t seed{7};
  float startPrice{100.0f};
  float volatility{0.5f};
  float bodyWidthFraction{0.6f};  // of the per-candle slot
  float minBodyHeight{0.01f};     // keeps flat candles visible
};

// Random-walk open/close pairs laid out left to right across
// [-0.9*aspect, 0.9*aspect] and normalized vertically into [-0.8, 0.8].
std::vector<CandleItem> generateCandleSeries(const SeriesConfig& cfg, float aspect);

} // namespace cs
