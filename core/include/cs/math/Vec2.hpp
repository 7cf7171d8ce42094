#pragma once

namespace cs {

struct Vec2 {
  float x{0}, y{0};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, float s) { return {a.x * s, a.y * s}; }
inline Vec2 operator/(Vec2 a, float s) { return {a.x / s, a.y / s}; }

// Component-wise
inline Vec2 mul(Vec2 a, Vec2 b) { return {a.x * b.x, a.y * b.y}; }
inline Vec2 div(Vec2 a, Vec2 b) { return {a.x / b.x, a.y / b.y}; }

inline Vec2& operator+=(Vec2& a, Vec2 b) { a.x += b.x; a.y += b.y; return a; }

inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }

} // namespace cs
