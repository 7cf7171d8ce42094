#include "cs/scene/Drawable.hpp"
#include <cstdio>

namespace cs {

GLenum toGlMode(Topology t) {
  switch (t) {
    case Topology::TriangleStrip: return GL_TRIANGLE_STRIP;
    case Topology::LineLoop:      return GL_LINE_LOOP;
  }
  return GL_TRIANGLE_STRIP;
}

bool Drawable::create(const DrawableSpec& spec) {
  name_ = spec.name;

  if (!spec.vertexShader || !spec.fragmentShader) {
    std::fprintf(stderr, "Drawable[%s]: missing shader source\n", name_.c_str());
    return false;
  }
  if (!program_.build(spec.vertexShader, spec.fragmentShader, spec.geometryShader)) {
    std::fprintf(stderr, "Drawable[%s]: failed to build program\n", name_.c_str());
    return false;
  }

  GLint loc = program_.attribLocation(spec.attribute);
  if (loc < 0) {
    std::fprintf(stderr, "Drawable[%s]: attribute '%s' not found\n",
                 name_.c_str(), spec.attribute);
    return false;
  }
  if (!buffer_.upload(spec.vertices, spec.componentsPerVertex, loc)) {
    std::fprintf(stderr, "Drawable[%s]: vertex upload failed\n", name_.c_str());
    return false;
  }

  mode_ = toGlMode(spec.topology);
  return true;
}

GLint Drawable::requireUniform(const char* uniform) const {
  GLint loc = program_.requireUniform(uniform);
  if (loc < 0) {
    std::fprintf(stderr, "Drawable[%s]: missing uniform '%s'\n", name_.c_str(), uniform);
  }
  return loc;
}

void Drawable::render(Stats& stats) const {
  program_.use();
  buffer_.bind();
  glDrawArrays(mode_, 0, buffer_.vertexCount());
  stats.drawCalls++;
  glBindVertexArray(0);
}

} // namespace cs
