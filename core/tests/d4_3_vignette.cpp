// D4.3: Background vignette math
// Tests:
//   1. Radius oscillates around the base
//   2. Attenuation: 1 at the cursor, linear, clamped at the radius
//   3. Negative radius clamps to a tiny epsilon

#include "cs/scene/Background.hpp"

#include <cstdio>
#include <cstdlib>
#include <cmath>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  cs::BackgroundParams p;  // base 0.6, amplitude 0.15, omega 1.5, falloff 0.85
  const double quarter = 3.14159265358979 / (2.0 * 1.5);

  // --- Test 1: radius ---
  {
    requireNear(cs::vignetteRadius(p, 0.0), 0.6f, 1e-6f, "radius at t=0");
    requireNear(cs::vignetteRadius(p, quarter), 0.75f, 1e-5f, "radius at peak");
    requireNear(cs::vignetteRadius(p, 3.0 * quarter), 0.45f, 1e-5f, "radius at trough");
    std::printf("  Test 1 (radius): PASS\n");
  }

  // --- Test 2: attenuation ---
  {
    requireNear(cs::vignetteAttenuation(p, 0.0f, 0.0), 1.0f, 1e-6f, "full at cursor");
    requireNear(cs::vignetteAttenuation(p, 0.3f, 0.0), 1.0f - 0.85f * 0.5f, 1e-6f, "half radius");
    requireNear(cs::vignetteAttenuation(p, 0.6f, 0.0), 0.15f, 1e-6f, "at radius");
    requireNear(cs::vignetteAttenuation(p, 5.0f, 0.0), 0.15f, 1e-6f, "clamped beyond");
    requireTrue(cs::vignetteAttenuation(p, 0.5f, quarter) >
                cs::vignetteAttenuation(p, 0.5f, 0.0), "wider radius is brighter");
    std::printf("  Test 2 (attenuation): PASS\n");
  }

  // --- Test 3: degenerate radius ---
  {
    cs::BackgroundParams bad;
    bad.radiusBase = 0.1f;
    bad.radiusAmplitude = 1.0f;
    float r = cs::vignetteRadius(bad, 3.0 * quarter);
    requireTrue(r > 0.0f, "radius stays positive");
    float a = cs::vignetteAttenuation(bad, 0.01f, 3.0 * quarter);
    requireTrue(std::isfinite(a), "attenuation finite");
    requireNear(a, 1.0f - bad.falloff, 1e-6f, "fully attenuated");
    std::printf("  Test 3 (degenerate radius): PASS\n");
  }

  std::printf("D4.3 vignette: ALL PASS\n");
  return 0;
}
