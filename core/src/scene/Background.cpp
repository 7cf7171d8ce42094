#include "cs/scene/Background.hpp"
#include "cs/scene/QuadMesh.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cs {

static const char* kBackgroundVert = R"GLSL(
#version 330 core
in vec2 a_pos;
out vec2 v_clip;
void main() {
    v_clip = a_pos;
    gl_Position = vec4(a_pos, 0.999, 1.0);
}
)GLSL";

// Same math as vignetteRadius()/vignetteAttenuation().
static const char* kBackgroundFrag = R"GLSL(
#version 330 core
uniform vec2 u_cursor;
uniform float u_aspect;
uniform float u_time;
uniform vec3 u_tint;
uniform float u_radiusBase;
uniform float u_radiusAmplitude;
uniform float u_radiusOmega;
uniform float u_falloff;
in vec2 v_clip;
out vec4 outColor;
void main() {
    vec2 d = (v_clip - u_cursor) * vec2(u_aspect, 1.0);
    float radius = max(u_radiusBase + u_radiusAmplitude * sin(u_time * u_radiusOmega), 1e-4);
    float t = clamp(length(d) / radius, 0.0, 1.0);
    outColor = vec4(u_tint * (1.0 - u_falloff * t), 1.0);
}
)GLSL";

float vignetteRadius(const BackgroundParams& p, double time) {
  float r = p.radiusBase +
            p.radiusAmplitude * static_cast<float>(std::sin(time * static_cast<double>(p.radiusOmega)));
  return std::max(r, 1e-4f);
}

float vignetteAttenuation(const BackgroundParams& p, float distance, double time) {
  float t = std::min(1.0f, std::max(0.0f, distance / vignetteRadius(p, time)));
  return 1.0f - p.falloff * t;
}

Background::Background(const Rgb& tint, const BackgroundParams& params)
  : tint_(tint), params_(params) {}

DrawableSpec Background::spec() {
  DrawableSpec s;
  s.name = "background";
  s.vertices = quadStripVertices();
  s.componentsPerVertex = kQuadComponents;
  s.vertexShader = kBackgroundVert;
  s.fragmentShader = kBackgroundFrag;
  s.topology = Topology::TriangleStrip;
  return s;
}

bool Background::create() {
  if (!quad_.create(spec())) return false;

  cursor_ = quad_.requireUniform("u_cursor");
  aspect_ = quad_.requireUniform("u_aspect");
  time_ = quad_.requireUniform("u_time");
  tintLoc_ = quad_.requireUniform("u_tint");
  radiusBase_ = quad_.requireUniform("u_radiusBase");
  radiusAmp_ = quad_.requireUniform("u_radiusAmplitude");
  radiusOmega_ = quad_.requireUniform("u_radiusOmega");
  falloff_ = quad_.requireUniform("u_falloff");

  if (cursor_ < 0 || aspect_ < 0 || time_ < 0 || tintLoc_ < 0 ||
      radiusBase_ < 0 || radiusAmp_ < 0 || radiusOmega_ < 0 || falloff_ < 0) {
    std::fprintf(stderr, "Background: program is missing required uniforms\n");
    return false;
  }
  return true;
}

void Background::update(const FrameContext& ctx) {
  const ShaderProgram& p = quad_.program();
  p.use();

  Vec2 c = ctx.viewport.pixelToClip(ctx.cursorPx);
  p.setUniformVec2(cursor_, c.x, c.y);
  p.setUniformFloat(aspect_, ctx.viewport.aspectRatio());
  p.setUniformFloat(time_, static_cast<float>(ctx.time));
  p.setUniformVec3(tintLoc_, tint_.r, tint_.g, tint_.b);
  p.setUniformFloat(radiusBase_, params_.radiusBase);
  p.setUniformFloat(radiusAmp_, params_.radiusAmplitude);
  p.setUniformFloat(radiusOmega_, params_.radiusOmega);
  p.setUniformFloat(falloff_, params_.falloff);
}

void Background::render(Stats& stats) const {
  quad_.render(stats);
}

} // namespace cs
