// D1.1: Hex colour parsing
// Tests:
//   1. Valid "#RRGGBB" maps each byte to [0,1]
//   2. Lowercase digits rejected, output left untouched
//   3. Wrong length rejected
//   4. Missing '#' rejected
//   5. Non-hex characters rejected, output left untouched
//   6. toHexColor formats uppercase and clamps

#include "cs/style/Color.hpp"

#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <string>

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
  // --- Test 1: valid colours ---
  {
    cs::Rgb c;
    requireTrue(cs::parseHexColor("#FF0000", c), "parse #FF0000");
    requireNear(c.r, 1.0f, 1e-6f, "red R");
    requireNear(c.g, 0.0f, 1e-6f, "red G");
    requireNear(c.b, 0.0f, 1e-6f, "red B");

    requireTrue(cs::parseHexColor("#123456", c), "parse #123456");
    requireNear(c.r, 18.0f / 255.0f, 1e-6f, "0x12");
    requireNear(c.g, 52.0f / 255.0f, 1e-6f, "0x34");
    requireNear(c.b, 86.0f / 255.0f, 1e-6f, "0x56");

    requireTrue(cs::parseHexColor("#000000", c), "parse black");
    requireNear(c.r + c.g + c.b, 0.0f, 1e-6f, "black is zero");

    std::printf("  Test 1 (valid #RRGGBB): PASS\n");
  }

  // --- Test 2: lowercase ---
  {
    cs::Rgb upper;
    requireTrue(cs::parseHexColor("#ABCDEF", upper), "parse uppercase");
    requireNear(upper.r, 171.0f / 255.0f, 1e-6f, "0xAB");

    cs::Rgb c{0.25f, 0.5f, 0.75f};
    requireTrue(!cs::parseHexColor("#abcdef", c), "lowercase rejected");
    requireTrue(!cs::parseHexColor("#ff0000", c), "lowercase ff rejected");
    requireTrue(!cs::parseHexColor("#FFFFFf", c), "one lowercase digit rejected");
    requireNear(c.r, 0.25f, 0.0f, "R untouched");
    requireNear(c.g, 0.5f, 0.0f, "G untouched");
    requireNear(c.b, 0.75f, 0.0f, "B untouched");
    std::printf("  Test 2 (lowercase digits): PASS\n");
  }

  // --- Test 3: invalid length ---
  {
    cs::Rgb c;
    requireTrue(!cs::parseHexColor("#FFF", c), "short rejected");
    requireTrue(!cs::parseHexColor("#FF00000", c), "long rejected");
    requireTrue(!cs::parseHexColor("", c), "empty rejected");
    requireTrue(!cs::parseHexColor("#", c), "bare hash rejected");
    std::printf("  Test 3 (invalid length): PASS\n");
  }

  // --- Test 4: missing hash ---
  {
    cs::Rgb c;
    requireTrue(!cs::parseHexColor("FF00000", c), "7 chars without hash rejected");
    requireTrue(!cs::parseHexColor("FF0000", c), "6 chars without hash rejected");
    std::printf("  Test 4 (missing '#'): PASS\n");
  }

  // --- Test 5: invalid characters leave output untouched ---
  {
    cs::Rgb c{0.25f, 0.5f, 0.75f};
    requireTrue(!cs::parseHexColor("#GG0000", c), "G rejected");
    requireTrue(!cs::parseHexColor("#12345Z", c), "trailing Z rejected");
    requireTrue(!cs::parseHexColor("# 12345", c), "space rejected");
    requireNear(c.r, 0.25f, 0.0f, "R untouched");
    requireNear(c.g, 0.5f, 0.0f, "G untouched");
    requireNear(c.b, 0.75f, 0.0f, "B untouched");
    std::printf("  Test 5 (invalid chars): PASS\n");
  }

  // --- Test 6: formatting ---
  {
    requireTrue(cs::toHexColor({1.0f, 0.0f, 0.0f}) == "#FF0000", "format red");
    requireTrue(cs::toHexColor({2.0f, -1.0f, 0.5f}) == "#FF0080", "format clamps");

    cs::Rgb c;
    requireTrue(cs::parseHexColor(cs::toHexColor({0.2f, 0.4f, 0.6f}), c), "reparse");
    requireNear(c.g, 0.4f, 1.0f / 255.0f, "reparse G within one step");
    std::printf("  Test 6 (toHexColor): PASS\n");
  }

  std::printf("D1.1 hex_color: ALL PASS\n");
  return 0;
}
