#include "cs/scene/Candle.hpp"
#include "cs/scene/QuadMesh.hpp"
#include <cstdio>

namespace cs {

// ---- Shared vertex shader (fill + outline) ----
// Mirrors quadToClip() in cs/math/QuadTransform.hpp.

static const char* kCandleVert = R"GLSL(
#version 330 core
in vec2 a_pos;
uniform vec2 u_position;
uniform vec2 u_scale;
uniform float u_aspect;
uniform vec2 u_offset;
out vec2 v_local;
void main() {
    vec2 local = a_pos * 0.5;
    vec2 p = (local * u_scale + u_position) / vec2(u_aspect, 1.0)
           + u_offset * vec2(1.0, -1.0);
    gl_Position = vec4(p, 0.0, 1.0);
    v_local = local;
}
)GLSL";

// ---- Body ----

static const char* kBodyFrag = R"GLSL(
#version 330 core
uniform vec3 u_color;
uniform float u_time;
uniform float u_noiseStrength;
in vec2 v_local;
out vec4 outColor;

float hash(vec2 p) {
    return fract(sin(dot(p, vec2(127.1, 311.7))) * 43758.5453);
}

// Value noise, smooth in p
float noise(vec2 p) {
    vec2 i = floor(p);
    vec2 f = fract(p);
    vec2 u = f * f * (3.0 - 2.0 * f);
    return mix(mix(hash(i),                  hash(i + vec2(1.0, 0.0)), u.x),
               mix(hash(i + vec2(0.0, 1.0)), hash(i + vec2(1.0, 1.0)), u.x), u.y);
}

void main() {
    float n = noise(v_local * 6.0 + vec2(u_time * 0.7, u_time * 0.4));
    float k = 1.0 - u_noiseStrength + u_noiseStrength * n;
    outColor = vec4(u_color * k, 1.0);
}
)GLSL";

// ---- Outline ----
// Each loop segment becomes a quad of constant width. Work happens in
// aspect space (x * aspect) so the border is equally thick on all sides;
// segments are extended by half the width so corners close.

static const char* kOutlineGeom = R"GLSL(
#version 330 core
layout(lines) in;
layout(triangle_strip, max_vertices = 4) out;
uniform float u_aspect;
uniform float u_lineWidth;

void emit(vec2 p, float z) {
    gl_Position = vec4(p.x / u_aspect, p.y, z, 1.0);
    EmitVertex();
}

void main() {
    vec2 toAspect = vec2(u_aspect, 1.0);
    vec2 a = gl_in[0].gl_Position.xy * toAspect;
    vec2 b = gl_in[1].gl_Position.xy * toAspect;
    float z = gl_in[0].gl_Position.z;

    vec2 dir = b - a;
    float len = length(dir);
    vec2 d = (len > 1e-6) ? dir / len : vec2(1.0, 0.0);
    vec2 n = vec2(-d.y, d.x);
    float hw = u_lineWidth * 0.5;

    vec2 a0 = a - d * hw;
    vec2 b0 = b + d * hw;
    emit(a0 + n * hw, z);
    emit(a0 - n * hw, z);
    emit(b0 + n * hw, z);
    emit(b0 - n * hw, z);
    EndPrimitive();
}
)GLSL";

static const char* kOutlineFrag = R"GLSL(
#version 330 core
uniform vec3 u_color;
out vec4 outColor;
void main() {
    outColor = vec4(u_color, 1.0);
}
)GLSL";

Candle::Candle(const CandleItem& item, const CandleStyle& style)
  : item_(item), style_(style) {}

DrawableSpec Candle::fillSpec() {
  DrawableSpec s;
  s.name = "candle.fill";
  s.vertices = quadStripVertices();
  s.componentsPerVertex = kQuadComponents;
  s.vertexShader = kCandleVert;
  s.fragmentShader = kBodyFrag;
  s.topology = Topology::TriangleStrip;
  return s;
}

DrawableSpec Candle::outlineSpec() {
  DrawableSpec s;
  s.name = "candle.outline";
  s.vertices = quadLoopVertices();
  s.componentsPerVertex = kQuadComponents;
  s.vertexShader = kCandleVert;
  s.fragmentShader = kOutlineFrag;
  s.geometryShader = kOutlineGeom;
  s.topology = Topology::LineLoop;
  return s;
}

bool Candle::resolveTransform(const Drawable& d, TransformLocs& out) {
  out.position = d.requireUniform("u_position");
  out.scale = d.requireUniform("u_scale");
  out.aspect = d.requireUniform("u_aspect");
  out.offset = d.requireUniform("u_offset");
  return out.position >= 0 && out.scale >= 0 && out.aspect >= 0 && out.offset >= 0;
}

bool Candle::create() {
  if (!outline_.create(outlineSpec())) return false;
  if (!fill_.create(fillSpec())) return false;

  bool ok = resolveTransform(fill_, fillXf_);
  fillColor_ = fill_.requireUniform("u_color");
  fillTime_ = fill_.requireUniform("u_time");
  fillNoise_ = fill_.requireUniform("u_noiseStrength");
  ok = ok && fillColor_ >= 0 && fillTime_ >= 0 && fillNoise_ >= 0;

  ok = resolveTransform(outline_, outlineXf_) && ok;
  outlineColor_ = outline_.requireUniform("u_color");
  outlineWidth_ = outline_.requireUniform("u_lineWidth");
  ok = ok && outlineColor_ >= 0 && outlineWidth_ >= 0;

  if (!ok) {
    std::fprintf(stderr, "Candle: program is missing required uniforms\n");
  }
  return ok;
}

void Candle::pushTransform(const ShaderProgram& prog, const TransformLocs& locs,
                           const FrameContext& ctx) const {
  prog.setUniformVec2(locs.position, item_.position.x, item_.position.y);
  prog.setUniformVec2(locs.scale, item_.scale.x, item_.scale.y);
  prog.setUniformFloat(locs.aspect, ctx.viewport.aspectRatio());
  prog.setUniformVec2(locs.offset, ctx.panOffset.x, ctx.panOffset.y);
}

void Candle::update(const FrameContext& ctx) {
  const ShaderProgram& fp = fill_.program();
  fp.use();
  pushTransform(fp, fillXf_, ctx);
  Rgb body = bodyColor();
  fp.setUniformVec3(fillColor_, body.r, body.g, body.b);
  fp.setUniformFloat(fillTime_, static_cast<float>(ctx.time));
  fp.setUniformFloat(fillNoise_, style_.noiseStrength);

  const ShaderProgram& op = outline_.program();
  op.use();
  pushTransform(op, outlineXf_, ctx);
  op.setUniformVec3(outlineColor_, style_.outlineColor.r, style_.outlineColor.g,
                    style_.outlineColor.b);
  op.setUniformFloat(outlineWidth_, ctx.viewport.pixelsToClipHeight(style_.outlineWidthPx));
}

void Candle::render(Stats& stats) const {
  outline_.render(stats);
  fill_.render(stats);
}

} // namespace cs
