#include "cs/scene/CandleItem.hpp"
#include "cs/scene/QuadMesh.hpp"

#include <vector>

namespace cs {

static std::array<Vec2, 4> footprint(const CandleItem& item, const std::vector<float>& mesh) {
  std::array<Vec2, 4> out{};
  for (std::size_t i = 0; i < out.size(); i++) {
    // Mesh corner -> centered unit quad, as the vertex shader does.
    Vec2 local{mesh[i * 2] * 0.5f, mesh[i * 2 + 1] * 0.5f};
    out[i] = mul(local, item.scale) + item.position;
  }
  return out;
}

std::array<Vec2, 4> fillCorners(const CandleItem& item) {
  return footprint(item, quadStripVertices());
}

std::array<Vec2, 4> outlineCorners(const CandleItem& item) {
  return footprint(item, quadLoopVertices());
}

} // namespace cs
