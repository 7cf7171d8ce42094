#pragma once
#include "cs/style/Color.hpp"

#include <string>

namespace cs {

struct Theme {
  std::string name;

  // Framebuffer clear (only visible where nothing draws)
  Rgb clearColor{0.0f, 0.0f, 0.0f};

  // Vignette base tint, attenuated away from the cursor
  Rgb backgroundTint{0.118f, 0.165f, 0.227f};

  // Candle bodies by polarity
  Rgb candleUp{0.149f, 0.651f, 0.604f};
  Rgb candleDown{0.937f, 0.325f, 0.314f};

  // Candle border
  Rgb outline{0.878f, 0.878f, 0.878f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Look up a preset by name ("dark" / "light", case-insensitive).
// Returns false for unknown names.
bool themeByName(const std::string& name, Theme& out);

} // namespace cs
