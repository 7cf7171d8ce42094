#include "cs/data/CandleSeries.hpp"

#include <algorithm>
#include <cmath>

namespace cs {

std::vector<CandleItem> generateCandleSeries(const SeriesConfig& cfg, float aspect) {
  std::vector<CandleItem> out;
  if (cfg.count == 0) return out;

  // RNG: simple LCG
  std::uint32_t seed = cfg.seed;
  auto rng = [&seed]() -> float {
    seed = seed * 1103515245u + 12345u;
    return static_cast<float>((seed >> 16) & 0x7FFF) / 32767.0f;
  };

  std::vector<float> opens(cfg.count), closes(cfg.count);
  float price = cfg.startPrice;
  float lo = price, hi = price;
  for (std::size_t i = 0; i < cfg.count; i++) {
    opens[i] = price;
    price += (rng() - 0.5f) * cfg.volatility * 2.0f;
    closes[i] = price;
    lo = std::min(lo, price);
    hi = std::max(hi, price);
  }

  auto toY = [lo, hi](float v) {
    if (hi - lo <= 0.0f) return 0.0f;
    return (v - lo) / (hi - lo) * 1.6f - 0.8f;
  };

  float left = -0.9f * aspect;
  float slot = 1.8f * aspect / static_cast<float>(cfg.count);

  out.reserve(cfg.count);
  for (std::size_t i = 0; i < cfg.count; i++) {
    float y0 = toY(opens[i]);
    float y1 = toY(closes[i]);

    CandleItem c;
    c.position = {left + slot * (static_cast<float>(i) + 0.5f), (y0 + y1) * 0.5f};
    c.scale = {slot * cfg.bodyWidthFraction, std::max(std::fabs(y1 - y0), cfg.minBodyHeight)};
    c.polarity = closes[i] >= opens[i];
    out.push_back(c);
  }
  return out;
}

} // namespace cs
