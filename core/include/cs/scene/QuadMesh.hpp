#pragma once
#include <vector>

namespace cs {

// The shared unit quad, positions in [-1,1]^2, 2 floats per vertex.
// Strip order fills the quad with GL_TRIANGLE_STRIP; loop order walks
// the same four corners around the perimeter for GL_LINE_LOOP.
//
//   2 ---- 3        3 ---- 2
//   |      |        |      |
//   0 ---- 1        0 ---- 1
//    strip            loop

inline const std::vector<float>& quadStripVertices() {
  static const std::vector<float> v = {
    -1.0f, -1.0f,
     1.0f, -1.0f,
    -1.0f,  1.0f,
     1.0f,  1.0f,
  };
  return v;
}

inline const std::vector<float>& quadLoopVertices() {
  static const std::vector<float> v = {
    -1.0f, -1.0f,
     1.0f, -1.0f,
     1.0f,  1.0f,
    -1.0f,  1.0f,
  };
  return v;
}

constexpr int kQuadComponents = 2;
constexpr int kQuadVertexCount = 4;

} // namespace cs
