#pragma once
#include "cs/scene/Background.hpp"
#include "cs/scene/Candle.hpp"

#include <cstddef>
#include <variant>
#include <vector>

namespace cs {

// The closed set of drawable variants.
using SceneItem = std::variant<Candle, Background>;

// Ordered, fixed collection of drawables. Insertion order is render
// order (later items draw on top, the depth test aside). Items are added
// before create() and never removed.
class Scene {
public:
  void add(SceneItem item);

  // Build every item's GPU resources. Stops at the first failure.
  bool create();

  void update(const FrameContext& ctx);
  void render(Stats& stats) const;

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const SceneItem& item(std::size_t i) const { return items_[i]; }
  bool created() const { return created_; }

private:
  std::vector<SceneItem> items_;
  bool created_{false};
};

} // namespace cs
