#pragma once

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
};

struct Rect {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;

  [[nodiscard]] bool empty() const { return w <= 0.0F || h <= 0.0F; }
  [[nodiscard]] float right() const { return x + w; }
  [[nodiscard]] float bottom() const { return y + h; }
  [[nodiscard]] Vec2 center() const { return {x + w * 0.5F, y + h * 0.5F}; }
};

// Open intervals: rectangles sharing an edge do not overlap, so a body can slide
// flush along a wall. Empty rectangles never overlap anything.
inline bool intersects(const Rect& a, const Rect& b) {
  if (a.empty() || b.empty())
    return false;
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h && a.y + a.h > b.y;
}
