// D1.2: Theme presets and lookup
// Tests:
//   1. darkTheme() and lightTheme() differ where it matters
//   2. themeByName is case-insensitive
//   3. Unknown names fail and leave the output alone

#include "cs/style/Theme.hpp"

#include <cstdio>
#include <cstdlib>
#include <cmath>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: presets ---
  {
    cs::Theme dark = cs::darkTheme();
    cs::Theme light = cs::lightTheme();

    requireTrue(dark.name == "dark", "dark name");
    requireTrue(light.name == "light", "light name");

    requireTrue(dark.backgroundTint.r < 0.5f, "dark tint is dark");
    requireTrue(light.backgroundTint.r > 0.5f, "light tint is light");
    requireTrue(dark.outline.r > light.outline.r, "dark outline brighter than light outline");

    // Up and down must be distinguishable in both presets
    for (const cs::Theme* t : {&dark, &light}) {
      requireTrue(t->candleUp.g > t->candleUp.r, "up is green-ish");
      requireTrue(t->candleDown.r > t->candleDown.g, "down is red-ish");
    }
    std::printf("  Test 1 (presets): PASS\n");
  }

  // --- Test 2: lookup ---
  {
    cs::Theme t;
    requireTrue(cs::themeByName("light", t), "light found");
    requireTrue(t.name == "light", "light applied");
    requireTrue(cs::themeByName("DARK", t), "DARK found");
    requireTrue(t.name == "dark", "dark applied");
    requireTrue(cs::themeByName("Light", t), "Light found");
    std::printf("  Test 2 (themeByName): PASS\n");
  }

  // --- Test 3: unknown ---
  {
    cs::Theme t = cs::lightTheme();
    requireTrue(!cs::themeByName("solarized", t), "unknown rejected");
    requireTrue(!cs::themeByName("", t), "empty rejected");
    requireTrue(t.name == "light", "output untouched");
    std::printf("  Test 3 (unknown theme): PASS\n");
  }

  std::printf("D1.2 theme: ALL PASS\n");
  return 0;
}
