#include "cs/style/Color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cs {

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& hex, Rgb& out) {
  if (hex.size() != 7 || hex[0] != '#') return false;

  int bytes[3];
  for (int i = 0; i < 3; i++) {
    int hi = hexDigit(hex[static_cast<std::size_t>(1 + i * 2)]);
    int lo = hexDigit(hex[static_cast<std::size_t>(2 + i * 2)]);
    if (hi < 0 || lo < 0) return false;
    bytes[i] = hi * 16 + lo;
  }

  out.r = static_cast<float>(bytes[0]) / 255.0f;
  out.g = static_cast<float>(bytes[1]) / 255.0f;
  out.b = static_cast<float>(bytes[2]) / 255.0f;
  return true;
}

static int toByte(float v) {
  float c = std::min(1.0f, std::max(0.0f, v));
  return static_cast<int>(std::lround(c * 255.0f));
}

std::string toHexColor(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", toByte(c.r), toByte(c.g), toByte(c.b));
  return buf;
}

} // namespace cs
