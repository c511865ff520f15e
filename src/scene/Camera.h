#pragma once

#include "util/Geometry.h"

class CameraSystem {
 public:
  static constexpr float kDefaultViewW = 640.0F;
  static constexpr float kDefaultViewH = 480.0F;

  CameraSystem() = default;
  CameraSystem(float viewW, float viewH);

  // Centers on (px, py) and clamps to the scene. An empty sceneBounds means the
  // scene size is unknown and the offset is left unclamped.
  void focusOn(float px, float py, const Rect& sceneBounds);

  [[nodiscard]] Vec2 worldToScreen(float wx, float wy) const;
  [[nodiscard]] Vec2 screenToWorld(float sx, float sy) const;

  [[nodiscard]] float x() const { return x_; }
  [[nodiscard]] float y() const { return y_; }
  [[nodiscard]] float w() const { return w_; }
  [[nodiscard]] float h() const { return h_; }
  [[nodiscard]] Rect view() const { return Rect{x_, y_, w_, h_}; }

 private:
  float x_ = 0.0F;
  float y_ = 0.0F;
  float w_ = kDefaultViewW;
  float h_ = kDefaultViewH;
};
