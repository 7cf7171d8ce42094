#include "cs/engine/Engine.hpp"

#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>

namespace cs {

Engine::Engine(const EngineConfig& config, std::unique_ptr<GlContext> context)
  : config_(config),
    context_(std::move(context)),
    viewport_(config.window.width, config.window.height),
    pan_(viewport_, config.panSpeed),
    clock_(config.frameRate) {
  animations_.setStepMode(config_.animation.stepMode, config_.frameRate);
}

bool Engine::init() {
  if (!context_) {
    std::fprintf(stderr, "Engine: no graphics context\n");
    return false;
  }
  if (!context_->init(config_.window.width, config_.window.height)) {
    std::fprintf(stderr, "Engine: graphics context init failed\n");
    return false;
  }

  // The framebuffer may differ from the requested window size (HiDPI).
  // Contexts deliver pointer events in framebuffer pixels to match.
  viewport_ = Viewport(context_->width(), context_->height());
  pan_ = PanModel(viewport_, config_.panSpeed);
  cursor_ = viewport_.size() * 0.5f;

  if (!renderer_.init()) {
    std::fprintf(stderr, "Engine: renderer init failed\n");
    return false;
  }

  buildScene();
  if (!scene_.create()) {
    std::fprintf(stderr, "Engine: scene creation failed\n");
    return false;
  }

  clock_.start();
  time_ = 0.0;
  dt_ = 0.0;
  running_ = true;
  std::printf("Engine: %dx%d, %zu drawables\n",
              viewport_.width(), viewport_.height(), scene_.size());
  return true;
}

void Engine::buildScene() {
  std::vector<CandleItem> items = config_.candles;
  if (items.empty()) {
    items = generateCandleSeries(config_.series, viewport_.aspectRatio());
  }

  CandleStyle style = config_.candleStyle();
  for (const auto& item : items) {
    scene_.add(Candle(item, style));
  }
  // Last, on the far plane: fills whatever the candles left uncovered.
  scene_.add(Background(config_.theme.backgroundTint, config_.background));
}

void Engine::run() {
  while (running_) {
    tick();
  }
}

void Engine::tick() {
  if (!running_ || !context_) return;

  for (const auto& e : context_->pollEvents()) {
    handleEvent(e);
  }

  update();
  lastStats_ = render();

  clock_.waitForNextFrame();
  advanceTime();
}

void Engine::advanceTime() {
  double t = clock_.elapsed();
  if (t <= time_) {
    t = std::nextafter(time_, std::numeric_limits<double>::infinity());
  }
  dt_ = t - time_;
  time_ = t;
  frameIndex_++;
}

void Engine::enqueuePan(KeyCode key) {
  float s = config_.animation.step;
  AnimationCommand cmd;
  switch (key) {
    case KeyCode::Left:  cmd = panBy(-s, 0.0f); break;
    case KeyCode::Right: cmd = panBy(s, 0.0f); break;
    // Offsets are in window orientation: negative Y moves content up.
    case KeyCode::Up:    cmd = panBy(0.0f, -s); break;
    case KeyCode::Down:  cmd = panBy(0.0f, s); break;
    default: return;
  }
  animations_.enqueue(cmd, time_, config_.animation.duration);
}

void Engine::handleEvent(const InputEvent& e) {
  switch (e.type) {
    case InputEventType::Quit:
      running_ = false;
      break;

    case InputEventType::KeyDown:
      if (e.key == KeyCode::Escape) running_ = false;
      else enqueuePan(e.key);
      break;

    case InputEventType::MouseDown:
      cursor_ = {static_cast<float>(e.x), static_cast<float>(e.y)};
      if (e.button == MouseButton::Right) pan_.beginDrag(cursor_);
      break;

    case InputEventType::MouseUp:
      cursor_ = {static_cast<float>(e.x), static_cast<float>(e.y)};
      if (e.button == MouseButton::Right) pan_.endDrag(cursor_);
      break;

    case InputEventType::CursorMove:
      cursor_ = {static_cast<float>(e.x), static_cast<float>(e.y)};
      break;
  }
}

FrameContext Engine::frameContext() const {
  FrameContext ctx;
  ctx.time = time_;
  ctx.cursorPx = cursor_;
  ctx.panOffset = pan_.total();
  ctx.viewport = viewport_;
  return ctx;
}

void Engine::update() {
  animations_.tick(time_, dt_, pan_);
  pan_.dragTick(cursor_);
  scene_.update(frameContext());
}

Stats Engine::render() {
  if (!context_) return Stats{};

  Stats stats = renderer_.render(scene_, viewport_, config_.theme.clearColor);
  context_->swapBuffers();

  stats.frameMs = dt_ * 1000.0;
  stats.activeAnimations = static_cast<std::uint32_t>(animations_.size());
  stats.frameIndex = frameIndex_;
  return stats;
}

} // namespace cs
