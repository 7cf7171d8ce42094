#include "cs/scene/Scene.hpp"
#include <cstdio>
#include <utility>

namespace cs {

void Scene::add(SceneItem item) {
  items_.push_back(std::move(item));
}

bool Scene::create() {
  created_ = false;
  for (std::size_t i = 0; i < items_.size(); i++) {
    bool ok = std::visit([](auto& d) { return d.create(); }, items_[i]);
    if (!ok) {
      std::fprintf(stderr, "Scene: item %zu failed to create\n", i);
      return false;
    }
  }
  created_ = true;
  return true;
}

void Scene::update(const FrameContext& ctx) {
  for (auto& item : items_) {
    std::visit([&ctx](auto& d) { d.update(ctx); }, item);
  }
}

void Scene::render(Stats& stats) const {
  for (const auto& item : items_) {
    std::visit([&stats](const auto& d) { d.render(stats); }, item);
  }
}

} // namespace cs
