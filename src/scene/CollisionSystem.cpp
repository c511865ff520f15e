#include "scene/CollisionSystem.h"

#include <algorithm>

void CollisionSystem::loadFromMetadata(const SceneMetadata& meta) {
  colliders_ = meta.colliders;
  interactives_ = meta.interactives;
}

void CollisionSystem::clear() {
  colliders_.clear();
  interactives_.clear();
}

bool CollisionSystem::isBlocked(const Rect& candidate) const {
  return std::ranges::any_of(colliders_,
                             [&](const Collider& c) { return intersects(candidate, c.rect); });
}

const Interactive* CollisionSystem::findInteractive(const Rect& playerRect) const {
  for (const auto& it : interactives_) {
    if (intersects(playerRect, it.rect))
      return &it;
  }
  return nullptr;
}
