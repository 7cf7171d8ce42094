#include "cs/gl/VertexBuffer.hpp"
#include <cstdio>
#include <utility>

namespace cs {

VertexBuffer::~VertexBuffer() {
  release();
}

VertexBuffer::VertexBuffer(VertexBuffer&& other) noexcept
  : vao_(std::exchange(other.vao_, 0)),
    vbo_(std::exchange(other.vbo_, 0)),
    vertexCount_(std::exchange(other.vertexCount_, 0)) {}

VertexBuffer& VertexBuffer::operator=(VertexBuffer&& other) noexcept {
  if (this != &other) {
    release();
    vao_ = std::exchange(other.vao_, 0);
    vbo_ = std::exchange(other.vbo_, 0);
    vertexCount_ = std::exchange(other.vertexCount_, 0);
  }
  return *this;
}

void VertexBuffer::release() {
  if (vbo_) {
    glDeleteBuffers(1, &vbo_);
    vbo_ = 0;
  }
  if (vao_) {
    glDeleteVertexArrays(1, &vao_);
    vao_ = 0;
  }
  vertexCount_ = 0;
}

bool VertexBuffer::upload(const std::vector<float>& floats, int componentsPerVertex,
                          GLint attribLoc) {
  if (componentsPerVertex <= 0 || floats.empty() ||
      floats.size() % static_cast<std::size_t>(componentsPerVertex) != 0) {
    std::fprintf(stderr, "VertexBuffer: %zu floats do not form %d-component vertices\n",
                 floats.size(), componentsPerVertex);
    return false;
  }
  if (attribLoc < 0) {
    std::fprintf(stderr, "VertexBuffer: invalid attribute location\n");
    return false;
  }

  release();

  glGenVertexArrays(1, &vao_);
  glGenBuffers(1, &vbo_);

  glBindVertexArray(vao_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(floats.size() * sizeof(float)),
               floats.data(), GL_STATIC_DRAW);

  glEnableVertexAttribArray(static_cast<GLuint>(attribLoc));
  glVertexAttribPointer(static_cast<GLuint>(attribLoc), componentsPerVertex,
                        GL_FLOAT, GL_FALSE, 0, nullptr);

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  vertexCount_ = static_cast<GLsizei>(floats.size() / static_cast<std::size_t>(componentsPerVertex));
  return true;
}

void VertexBuffer::bind() const {
  glBindVertexArray(vao_);
}

} // namespace cs
