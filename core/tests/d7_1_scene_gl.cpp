// D7.1: Scene GL integration (OSMesa)
// Tests:
//   1. Every drawable builds and issues its draw calls
//   2. Insertion order decides overlaps, stable over repeated frames
//   3. Outline: constant pixel width outside the body on all sides
//   4. Background fills everything the candles leave uncovered
//   5. Pan offset moves candles but not the background

#include "cs/gl/OsMesaContext.hpp"
#include "cs/gl/Renderer.hpp"
#include "cs/scene/Scene.hpp"
#include "cs/viewport/Viewport.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

struct Pixel {
  int r, g, b;
};

// (x, y) with y counted from the bottom row, as glReadPixels returns them.
static Pixel pixelAt(const std::vector<std::uint8_t>& px, int W, int x, int y) {
  std::size_t idx = (static_cast<std::size_t>(y) * W + x) * 4;
  return {px[idx], px[idx + 1], px[idx + 2]};
}

static bool isColor(Pixel p, int r, int g, int b) {
  const int tol = 3;
  return std::abs(p.r - r) <= tol && std::abs(p.g - g) <= tol && std::abs(p.b - b) <= tol;
}

static cs::CandleStyle flatStyle() {
  cs::CandleStyle s;
  s.colorUp = {0.0f, 1.0f, 0.0f};
  s.colorDown = {1.0f, 0.0f, 0.0f};
  s.outlineColor = {0.0f, 0.0f, 1.0f};
  s.outlineWidthPx = 4.0f;
  s.noiseStrength = 0.0f;
  return s;
}

static cs::BackgroundParams flatBackground() {
  cs::BackgroundParams p;
  p.falloff = 0.0f;  // uniform tint
  return p;
}

static cs::CandleItem candleAt(float x, float y, float w, float h, bool up) {
  cs::CandleItem c;
  c.position = {x, y};
  c.scale = {w, h};
  c.polarity = up;
  return c;
}

static cs::FrameContext frameFor(const cs::Viewport& vp, double time, cs::Vec2 offset = {}) {
  cs::FrameContext ctx;
  ctx.time = time;
  ctx.viewport = vp;
  ctx.cursorPx = vp.size() * 0.5f;
  ctx.panOffset = offset;
  return ctx;
}

int main() {
  constexpr int W = 64;
  constexpr int H = 64;

  cs::OsMesaContext ctx;
  if (!ctx.init(W, H)) {
    std::fprintf(stderr, "Could not init OSMesa, skipping test\n");
    return 0;
  }

  cs::Renderer renderer;
  requireTrue(renderer.init(), "renderer init");

  const cs::Viewport vp(W, H);
  const cs::Rgb clear{1.0f, 0.0f, 1.0f};       // magenta: must never show
  const cs::Rgb tint{0.5f, 0.5f, 0.5f};

  // --- Test 1 + 2: draw calls and overlap order ---
  {
    cs::Scene scene;
    scene.add(cs::Candle(candleAt(0.0f, 0.0f, 0.8f, 0.8f, true), flatStyle()));
    scene.add(cs::Candle(candleAt(0.2f, 0.0f, 0.8f, 0.8f, false), flatStyle()));
    scene.add(cs::Background(tint, flatBackground()));
    requireTrue(scene.create(), "scene create");
    requireTrue(scene.created(), "created flag");

    for (int frame = 0; frame < 5; frame++) {
      scene.update(frameFor(vp, frame / 60.0));
      cs::Stats st = renderer.render(scene, vp, clear);
      ctx.swapBuffers();
      requireTrue(st.drawCalls == 5, "2 per candle + 1 background");

      auto px = ctx.readPixels();
      requireTrue(isColor(pixelAt(px, W, 35, 32), 255, 0, 0), "overlap shows the later (down) candle");
      requireTrue(isColor(pixelAt(px, W, 22, 32), 0, 255, 0), "up candle alone");
    }
    std::printf("  Test 1 (draw calls): PASS\n");
    std::printf("  Test 2 (insertion order, 5 frames): PASS\n");
  }

  // Reversed order flips the overlap.
  {
    cs::Scene scene;
    scene.add(cs::Candle(candleAt(0.2f, 0.0f, 0.8f, 0.8f, false), flatStyle()));
    scene.add(cs::Candle(candleAt(0.0f, 0.0f, 0.8f, 0.8f, true), flatStyle()));
    scene.add(cs::Background(tint, flatBackground()));
    requireTrue(scene.create(), "reversed scene create");
    scene.update(frameFor(vp, 0.0));
    renderer.render(scene, vp, clear);
    ctx.swapBuffers();
    auto px = ctx.readPixels();
    requireTrue(isColor(pixelAt(px, W, 35, 32), 0, 255, 0), "overlap shows the later (up) candle");
    std::printf("  Test 2b (reversed order): PASS\n");
  }

  // --- Test 3 + 4: outline thickness, background ---
  {
    // Wide context so the aspect correction matters.
    constexpr int WW = 128;
    constexpr int HH = 64;
    cs::OsMesaContext wide;
    requireTrue(wide.init(WW, HH), "wide context");
    cs::Renderer r2;
    requireTrue(r2.init(), "wide renderer");
    const cs::Viewport wvp(WW, HH);

    // Body spans x in [48,80) and y in [16,48) pixels; 4px border = 2px outside.
    cs::Scene scene;
    scene.add(cs::Candle(candleAt(0.0f, 0.0f, 1.0f, 1.0f, true), flatStyle()));
    scene.add(cs::Background(tint, flatBackground()));
    requireTrue(scene.create(), "outline scene create");
    scene.update(frameFor(wvp, 0.0));
    r2.render(scene, wvp, clear);
    wide.swapBuffers();
    auto px = wide.readPixels();

    requireTrue(isColor(pixelAt(px, WW, 64, 32), 0, 255, 0), "body center");
    requireTrue(isColor(pixelAt(px, WW, 49, 32), 0, 255, 0), "fill covers the inner half");
    requireTrue(isColor(pixelAt(px, WW, 47, 32), 0, 0, 255), "left border, 1px out");
    requireTrue(isColor(pixelAt(px, WW, 46, 32), 0, 0, 255), "left border, 2px out");
    requireTrue(isColor(pixelAt(px, WW, 81, 32), 0, 0, 255), "right border");
    requireTrue(isColor(pixelAt(px, WW, 64, 15), 0, 0, 255), "bottom border, 1px out");
    requireTrue(isColor(pixelAt(px, WW, 64, 14), 0, 0, 255), "bottom border, 2px out");
    requireTrue(isColor(pixelAt(px, WW, 64, 49), 0, 0, 255), "top border");
    requireTrue(isColor(pixelAt(px, WW, 46, 14), 0, 0, 255), "corner closed");
    requireTrue(isColor(pixelAt(px, WW, 44, 32), 128, 128, 128), "background past left border");
    requireTrue(isColor(pixelAt(px, WW, 64, 12), 128, 128, 128), "background past bottom border");
    std::printf("  Test 3 (outline width, aspect %.1f): PASS\n", wvp.aspectRatio());

    for (int y = 0; y < HH; y += 7) {
      for (int x = 0; x < WW; x += 7) {
        requireTrue(!isColor(pixelAt(px, WW, x, y), 255, 0, 255), "no clear colour visible");
      }
    }
    requireTrue(isColor(pixelAt(px, WW, 2, 2), 128, 128, 128), "corner is tinted background");
    std::printf("  Test 4 (background fill): PASS\n");

    // --- Test 5: pan ---
    // Offset +0.25 in X is 16px at 128px wide: body now spans [64,96).
    scene.update(frameFor(wvp, 0.0, {0.25f, 0.0f}));
    r2.render(scene, wvp, clear);
    wide.swapBuffers();
    px = wide.readPixels();
    requireTrue(isColor(pixelAt(px, WW, 63, 32), 0, 0, 255), "left border moved right");
    requireTrue(isColor(pixelAt(px, WW, 46, 32), 128, 128, 128), "old border is background");
    requireTrue(isColor(pixelAt(px, WW, 90, 32), 0, 255, 0), "body moved right");
    requireTrue(isColor(pixelAt(px, WW, 64, 14), 0, 0, 255), "Y unaffected by X offset");
    std::printf("  Test 5 (pan offset): PASS\n");
  }

  std::printf("D7.1 scene_gl: ALL PASS\n");
  return 0;
}
