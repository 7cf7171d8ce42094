#pragma once
#include <string>

namespace cs {

struct Rgb {
  float r{0}, g{0}, b{0};
};

// Parse "#RRGGBB" into components in [0,1] (each channel / 255).
// Digits must be upper case (0-9, A-F). Returns false, leaving `out`
// untouched, when the length is not 7, the '#' is missing or a digit
// is not an upper-case hex digit.
bool parseHexColor(const std::string& hex, Rgb& out);

// Inverse of parseHexColor, upper case, rounding to the nearest byte.
std::string toHexColor(const Rgb& c);

} // namespace cs
