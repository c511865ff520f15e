#pragma once

#include <entt/entt.hpp>
#include <string>
#include <vector>

#include "core/Time.h"       // IWYU pragma: keep
#include "ecs/Components.h"  // IWYU pragma: keep
#include "util/Geometry.h"

class CameraSystem;
class CollisionSystem;
class SceneManager;

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

// Collaborators the tick reads from or drives. `scenes` may be null for
// scene-less runs (tests, tools); transitions are then never requested.
struct SimContext {
  CollisionSystem& collision;
  CameraSystem& camera;
  SceneManager* scenes = nullptr;
  Rect fallbackBounds{};
};

class World {
 public:
  EntityId create();

  EntityId spawnPlayer(Vec2 pos,
                       float w,
                       float h,
                       float speedPxPerMs,
                       std::vector<std::string> characters);

  void update(SimContext& ctx, const ActionState& actions, TimeStep ts);

  [[nodiscard]] Rect playerRect() const;

  entt::registry registry;

  // debug/test-friendly counters
  int transitionRequests = 0;
  int transitionsCompleted = 0;
  int transitionFailures = 0;
  int characterSwitches = 0;
  int blockedMoves = 0;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;

  // Actions from the previous tick. Advanced once at the end of update().
  ActionState previousActions{};
};
