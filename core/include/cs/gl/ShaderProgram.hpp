#pragma once
#include <glad/gl.h>

namespace cs {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  ShaderProgram(ShaderProgram&& other) noexcept;
  ShaderProgram& operator=(ShaderProgram&& other) noexcept;

  // Compile and link. The geometry stage is optional (nullptr = none).
  // Returns false on failure (errors go to stderr).
  bool build(const char* vertSrc, const char* fragSrc, const char* geomSrc = nullptr);

  void use() const;

  GLint attribLocation(const char* name) const;

  // Uniform location; a uniform the linked program does not expose
  // (misspelled or optimized out) is reported on stderr.
  GLint requireUniform(const char* name) const;

  void setUniformFloat(GLint loc, float v) const;
  void setUniformVec2(GLint loc, float x, float y) const;
  void setUniformVec3(GLint loc, float x, float y, float z) const;

private:
  void release();

  GLuint program_{0};
};

} // namespace cs
