#include "cs/style/Theme.hpp"

#include <cctype>

namespace cs {

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "light";

  t.clearColor = {1.0f, 1.0f, 1.0f};
  t.backgroundTint = {0.95f, 0.95f, 0.96f};

  t.candleUp = {0.1f, 0.7f, 0.3f};
  t.candleDown = {0.85f, 0.15f, 0.15f};

  t.outline = {0.2f, 0.2f, 0.25f};
  return t;
}

bool themeByName(const std::string& name, Theme& out) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "dark") { out = darkTheme(); return true; }
  if (lower == "light") { out = lightTheme(); return true; }
  return false;
}

} // namespace cs
