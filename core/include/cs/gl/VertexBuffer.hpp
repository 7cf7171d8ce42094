#pragma once
#include <glad/gl.h>
#include <vector>

namespace cs {

// One VAO + one VBO holding tightly packed float vertices bound to a
// single attribute. Data is uploaded once (GL_STATIC_DRAW).
class VertexBuffer {
public:
  VertexBuffer() = default;
  ~VertexBuffer();

  VertexBuffer(const VertexBuffer&) = delete;
  VertexBuffer& operator=(const VertexBuffer&) = delete;

  VertexBuffer(VertexBuffer&& other) noexcept;
  VertexBuffer& operator=(VertexBuffer&& other) noexcept;

  // Upload `floats` and describe them as `componentsPerVertex`-wide
  // vectors at attribute `attribLoc`. Returns false on bad input.
  bool upload(const std::vector<float>& floats, int componentsPerVertex, GLint attribLoc);

  void bind() const;

  GLsizei vertexCount() const { return vertexCount_; }

private:
  void release();

  GLuint vao_{0};
  GLuint vbo_{0};
  GLsizei vertexCount_{0};
};

} // namespace cs
