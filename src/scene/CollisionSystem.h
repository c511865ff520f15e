#pragma once

#include <cstddef>
#include <vector>

#include "scene/SceneMetadata.h"
#include "util/Geometry.h"

// Static geometry of the active scene. Both lists are swapped as a unit whenever
// a scene is published; nothing edits them in between.
class CollisionSystem {
 public:
  void loadFromMetadata(const SceneMetadata& meta);
  void clear();

  // True if the candidate overlaps any collider.
  [[nodiscard]] bool isBlocked(const Rect& candidate) const;

  // First interactive (list order) overlapping the rect, or nullptr.
  [[nodiscard]] const Interactive* findInteractive(const Rect& playerRect) const;

  [[nodiscard]] const std::vector<Collider>& colliders() const { return colliders_; }
  [[nodiscard]] const std::vector<Interactive>& interactives() const { return interactives_; }
  [[nodiscard]] std::size_t colliderCount() const { return colliders_.size(); }
  [[nodiscard]] std::size_t interactiveCount() const { return interactives_.size(); }

 private:
  std::vector<Collider> colliders_;
  std::vector<Interactive> interactives_;
};
