#pragma once
#include "cs/anim/AnimationQueue.hpp"
#include "cs/debug/Stats.hpp"
#include "cs/engine/EngineConfig.hpp"
#include "cs/engine/FrameClock.hpp"
#include "cs/gl/GlContext.hpp"
#include "cs/gl/Renderer.hpp"
#include "cs/scene/Scene.hpp"
#include "cs/viewport/PanModel.hpp"
#include "cs/viewport/Viewport.hpp"

#include <memory>

namespace cs {

// Owns the context, the scene and every piece of shared state, and
// drives them from one thread at a fixed tick rate.
class Engine {
public:
  Engine(const EngineConfig& config, std::unique_ptr<GlContext> context);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Create the context, the renderer and every drawable. Any failure is
  // fatal: the caller should exit.
  bool init();

  // Loop tick() until a quit event or Escape clears the running flag.
  void run();

  // One frame: dispatch input, update, render + present, wait for the
  // frame budget, advance time. No-op unless init() succeeded and the
  // engine is still running.
  void tick();

  void handleEvent(const InputEvent& e);

  // Apply animations and the live drag, then push uniforms.
  void update();

  // Draw the scene and present. Returns empty stats without a context.
  Stats render();

  bool isRunning() const { return running_; }
  void stop() { running_ = false; }

  double time() const { return time_; }
  double deltaTime() const { return dt_; }
  Vec2 cursor() const { return cursor_; }
  FrameContext frameContext() const;

  const PanModel& pan() const { return pan_; }
  const AnimationQueue& animations() const { return animations_; }
  const Scene& scene() const { return scene_; }
  const Viewport& viewport() const { return viewport_; }
  const EngineConfig& config() const { return config_; }
  const Stats& lastStats() const { return lastStats_; }
  GlContext& context() { return *context_; }

private:
  void buildScene();
  void advanceTime();
  void enqueuePan(KeyCode key);

  EngineConfig config_;
  std::unique_ptr<GlContext> context_;
  Viewport viewport_;
  PanModel pan_;
  AnimationQueue animations_;
  FrameClock clock_;
  Renderer renderer_;
  Scene scene_;

  Vec2 cursor_;
  double time_{0};
  double dt_{0};
  bool running_{false};
  std::uint64_t frameIndex_{0};
  Stats lastStats_{};
};

} // namespace cs
