#pragma once
#include <cmath>

namespace vclimb {

// Screen-space 2D vector (pixels). +y points down, so climbing decreases y.
struct Vec2 {
  double x{};
  double y{};

  Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
  Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }
  Vec2& operator*=(double s)      { x *= s;   y *= s;   return *this; }

  double length() const { return std::sqrt(x*x + y*y); }
};

inline Vec2 operator+(Vec2 a, const Vec2& b) { return a += b; }
inline Vec2 operator-(Vec2 a, const Vec2& b) { return a -= b; }
inline Vec2 operator*(Vec2 a, double s)      { return a *= s; }
inline Vec2 operator*(double s, Vec2 a)      { return a *= s; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }

inline double distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

// Axis-aligned box, top-left anchored.
struct Rect {
  double x{};
  double y{};
  double w{};
  double h{};

  double left() const   { return x; }
  double right() const  { return x + w; }
  double top() const    { return y; }
  double bottom() const { return y + h; }
  Vec2 center() const   { return Vec2{x + w * 0.5, y + h * 0.5}; }

  bool overlaps(const Rect& o) const {
    return x < o.x + o.w && o.x < x + w && y < o.y + o.h && o.y < y + h;
  }
};

inline double clamp01(double v) {
  return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v);
}

} // namespace vclimb
