#pragma once
#include "cs/debug/Stats.hpp"
#include "cs/gl/ShaderProgram.hpp"
#include "cs/gl/VertexBuffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs {

enum class Topology : std::uint8_t {
  TriangleStrip,
  LineLoop
};

GLenum toGlMode(Topology t);

// Everything a drawable variant supplies to build its GPU side.
struct DrawableSpec {
  std::string name;                     // for error messages
  std::vector<float> vertices;          // vertex data
  const char* attribute{"a_pos"};       // vertex attribute name
  int componentsPerVertex{2};           // buffer format: N floats per vertex
  const char* vertexShader{nullptr};
  const char* fragmentShader{nullptr};
  const char* geometryShader{nullptr};  // optional
  Topology topology{Topology::TriangleStrip};
};

// One vertex buffer + one program + a fixed draw mode. Vertex data is
// uploaded once by create(); only uniforms change afterwards.
class Drawable {
public:
  // Compile the program and upload the vertex data. Returns false on
  // any failure (errors go to stderr).
  bool create(const DrawableSpec& spec);

  // Resolve a uniform the drawable will write. Negative = missing.
  GLint requireUniform(const char* uniform) const;

  // Exactly one draw call.
  void render(Stats& stats) const;

  const ShaderProgram& program() const { return program_; }

private:
  std::string name_;
  ShaderProgram program_;
  VertexBuffer buffer_;
  GLenum mode_{GL_TRIANGLE_STRIP};
};

} // namespace cs
