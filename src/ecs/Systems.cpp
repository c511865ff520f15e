#include "ecs/Systems.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <optional>

#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "scene/Camera.h"
#include "scene/CollisionSystem.h"
#include "scene/SceneManager.h"

namespace Systems {

namespace {
constexpr float kInvSqrt2 = 0.70710678F;

// Bounds the player is confined to: the active scene when its size is known,
// otherwise the fallback viewport area.
Rect confinement(const SimContext& ctx) {
  Rect r{};
  if (ctx.scenes != nullptr && ctx.scenes->activeBounds(r))
    return r;
  return ctx.fallbackBounds;
}

// Top-left position that keeps a w x h box inside `area`; unchanged if `area` is empty.
Vec2 clampInto(Vec2 pos, float w, float h, const Rect& area) {
  if (area.empty())
    return pos;
  const float maxX = std::max(area.x, area.right() - w);
  const float maxY = std::max(area.y, area.bottom() - h);
  return Vec2{std::clamp(pos.x, area.x, maxX), std::clamp(pos.y, area.y, maxY)};
}

Rect sceneBoundsOrEmpty(const SimContext& ctx) {
  Rect r{};
  if (ctx.scenes != nullptr && ctx.scenes->activeBounds(r))
    return r;
  return Rect{};
}
}  // namespace

void sceneTransitions(World& w, SimContext& ctx) {
  if (ctx.scenes == nullptr)
    return;

  std::optional<SceneLoadResult> result = ctx.scenes->poll();
  if (!result)
    return;

  if (!result->ok()) {
    ++w.transitionFailures;
    std::cerr << "scene '" << result->name << "' failed to load ("
              << sceneErrorName(result->error) << "): " << result->message << "\n";
    return;
  }

  ++w.transitionsCompleted;
  if (result->spawn && w.player != kInvalidEntity && w.registry.valid(w.player)) {
    w.registry.get<Transform>(w.player).pos = *result->spawn;
  }
}

void movement(World& w, SimContext& ctx, TimeStep ts) {
  auto view = w.registry.view<PlayerTag, Transform, AABB, MoveSpeed, Facing, MoveState,
                              InputSnapshot>();
  for (auto entity : view) {
    auto& t = view.get<Transform>(entity);
    const auto& box = view.get<AABB>(entity);
    const auto& speed = view.get<MoveSpeed>(entity);
    auto& facing = view.get<Facing>(entity);
    auto& state = view.get<MoveState>(entity);
    const ActionState& in = view.get<InputSnapshot>(entity).current;

    state = MoveState::Idle;

    float dx = (in.right ? 1.0F : 0.0F) - (in.left ? 1.0F : 0.0F);
    float dy = (in.down ? 1.0F : 0.0F) - (in.up ? 1.0F : 0.0F);
    if (dx == 0.0F && dy == 0.0F)
      continue;
    if (dx != 0.0F && dy != 0.0F) {
      dx *= kInvSqrt2;
      dy *= kInvSqrt2;
    }

    // The collision test sees the position the player will actually occupy.
    const float step = speed.pxPerMs * ts.dtMs;
    const Vec2 candidate =
        clampInto(Vec2{t.pos.x + dx * step, t.pos.y + dy * step}, box.w, box.h, confinement(ctx));
    const Rect candidateRect{candidate.x, candidate.y, box.w, box.h};
    if (ctx.collision.isBlocked(candidateRect)) {
      ++w.blockedMoves;
      continue;
    }

    t.pos = candidate;
    state = MoveState::Walking;
    if (std::fabs(dx) > std::fabs(dy)) {
      facing = (dx > 0.0F) ? Facing::Right : Facing::Left;
    } else {
      facing = (dy > 0.0F) ? Facing::Down : Facing::Up;
    }
  }
}

void clampToBounds(World& w, SimContext& ctx) {
  const Rect area = confinement(ctx);
  auto view = w.registry.view<PlayerTag, Transform, AABB>();
  for (auto entity : view) {
    auto& t = view.get<Transform>(entity);
    const auto& box = view.get<AABB>(entity);
    t.pos = clampInto(t.pos, box.w, box.h, area);
  }
}

void followCamera(World& w, SimContext& ctx) {
  if (w.player == kInvalidEntity || !w.registry.valid(w.player))
    return;
  const Vec2 c = w.playerRect().center();
  ctx.camera.focusOn(c.x, c.y, sceneBoundsOrEmpty(ctx));
}

void interact(World& w, SimContext& ctx) {
  if (w.player == kInvalidEntity || !w.registry.valid(w.player))
    return;

  const auto& snap = w.registry.get<InputSnapshot>(w.player);
  if (!snap.interactPressed())
    return;

  const Interactive* hit = ctx.collision.findInteractive(w.playerRect());
  if (hit == nullptr || !hit->isDoor() || hit->destinationScene.empty())
    return;
  if (ctx.scenes == nullptr)
    return;

  if (ctx.scenes->loadScene(hit->destinationScene, hit->spawnPoint))
    ++w.transitionRequests;
}

void switchCharacter(World& w) {
  auto view = w.registry.view<PlayerTag, CharacterRoster, InputSnapshot>();
  for (auto entity : view) {
    auto& roster = view.get<CharacterRoster>(entity);
    if (!view.get<InputSnapshot>(entity).switchPressed() || roster.names.empty())
      continue;

    roster.index = (roster.index + 1) % roster.names.size();
    ++w.characterSwitches;
    std::printf("character: %s\n", roster.current().c_str());
  }
}

}  // namespace Systems
