#include "cs/export/Snapshot.hpp"
#include <cstdio>

namespace cs {

bool writePPMFlipped(const std::string& path,
                     const std::vector<std::uint8_t>& pixels,
                     int width, int height) {
  std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4;
  if (width <= 0 || height <= 0 || pixels.size() < expected) {
    std::fprintf(stderr, "writePPMFlipped: %zu bytes is not a %dx%d RGBA image\n",
                 pixels.size(), width, height);
    return false;
  }

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePPMFlipped: cannot open %s\n", path.c_str());
    return false;
  }

  std::fprintf(f, "P6\n%d %d\n255\n", width, height);
  for (int y = height - 1; y >= 0; y--) {
    for (int x = 0; x < width; x++) {
      std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                          static_cast<std::size_t>(x)) * 4;
      std::fputc(pixels[idx + 0], f); // R
      std::fputc(pixels[idx + 1], f); // G
      std::fputc(pixels[idx + 2], f); // B
    }
  }

  bool ok = std::ferror(f) == 0;
  if (std::fclose(f) != 0) ok = false;
  return ok;
}

} // namespace cs
