#include "cs/gl/ShaderProgram.hpp"
#include <cstdio>
#include <utility>
#include <vector>

namespace cs {

ShaderProgram::~ShaderProgram() {
  release();
}

ShaderProgram::ShaderProgram(ShaderProgram&& other) noexcept
  : program_(std::exchange(other.program_, 0)) {}

ShaderProgram& ShaderProgram::operator=(ShaderProgram&& other) noexcept {
  if (this != &other) {
    release();
    program_ = std::exchange(other.program_, 0);
  }
  return *this;
}

void ShaderProgram::release() {
  if (program_) {
    glDeleteProgram(program_);
    program_ = 0;
  }
}

static const char* stageName(GLenum type) {
  switch (type) {
    case GL_VERTEX_SHADER: return "vertex";
    case GL_GEOMETRY_SHADER: return "geometry";
    case GL_FRAGMENT_SHADER: return "fragment";
    default: return "unknown";
  }
}

static GLuint compileShader(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "Shader compile error (%s):\n%s\n", stageName(type), log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc, const char* geomSrc) {
  release();

  GLuint vs = compileShader(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;

  GLuint gs = 0;
  if (geomSrc) {
    gs = compileShader(GL_GEOMETRY_SHADER, geomSrc);
    if (!gs) { glDeleteShader(vs); return false; }
  }

  GLuint fs = compileShader(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) {
    glDeleteShader(vs);
    if (gs) glDeleteShader(gs);
    return false;
  }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  if (gs) glAttachShader(program_, gs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);

  // Shaders can be deleted after linking.
  glDeleteShader(vs);
  if (gs) glDeleteShader(gs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    std::fprintf(stderr, "Program link error:\n%s\n", log.data());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::requireUniform(const char* name) const {
  GLint loc = glGetUniformLocation(program_, name);
  if (loc < 0) {
    std::fprintf(stderr, "ShaderProgram: uniform '%s' not found in program %u\n",
                 name, program_);
  }
  return loc;
}

void ShaderProgram::setUniformFloat(GLint loc, float v) const {
  glUniform1f(loc, v);
}

void ShaderProgram::setUniformVec2(GLint loc, float x, float y) const {
  glUniform2f(loc, x, y);
}

void ShaderProgram::setUniformVec3(GLint loc, float x, float y, float z) const {
  glUniform3f(loc, x, y, z);
}

} // namespace cs
