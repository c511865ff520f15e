#include "scene/Camera.h"

#include <algorithm>
#include <cmath>

CameraSystem::CameraSystem(float viewW, float viewH)
    : w_(std::max(1.0F, viewW)), h_(std::max(1.0F, viewH)) {}

void CameraSystem::focusOn(float px, float py, const Rect& sceneBounds) {
  float tx = std::round(px - w_ * 0.5F);
  float ty = std::round(py - h_ * 0.5F);

  if (!sceneBounds.empty()) {
    tx = std::clamp(tx, 0.0F, std::max(0.0F, sceneBounds.w - w_));
    ty = std::clamp(ty, 0.0F, std::max(0.0F, sceneBounds.h - h_));
  }

  x_ = tx;
  y_ = ty;
}

Vec2 CameraSystem::worldToScreen(float wx, float wy) const {
  return Vec2{std::round(wx - x_), std::round(wy - y_)};
}

Vec2 CameraSystem::screenToWorld(float sx, float sy) const {
  return Vec2{sx + x_, sy + y_};
}
