#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace cs {

// Write RGBA pixels as binary PPM (P6), dropping alpha. Rows are written
// bottom-up so a glReadPixels buffer comes out upright.
bool writePPMFlipped(const std::string& path,
                     const std::vector<std::uint8_t>& pixels,
                     int width, int height);

} // namespace cs
