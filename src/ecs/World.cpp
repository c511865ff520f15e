#include "ecs/World.h"

#include <utility>

#include "ecs/Systems.h"

EntityId World::create() {
  return registry.create();
}

EntityId World::spawnPlayer(Vec2 pos,
                            float w,
                            float h,
                            float speedPxPerMs,
                            std::vector<std::string> characters) {
  if (player != kInvalidEntity && registry.valid(player))
    registry.destroy(player);

  const EntityId e = create();
  registry.emplace<PlayerTag>(e);
  registry.emplace<Transform>(e, pos);
  registry.emplace<AABB>(e, w, h);
  registry.emplace<MoveSpeed>(e, speedPxPerMs);
  registry.emplace<Facing>(e, Facing::Down);
  registry.emplace<MoveState>(e, MoveState::Idle);
  registry.emplace<InputSnapshot>(e);

  CharacterRoster roster{};
  roster.names = std::move(characters);
  registry.emplace<CharacterRoster>(e, std::move(roster));

  player = e;
  return e;
}

Rect World::playerRect() const {
  if (player == kInvalidEntity || !registry.valid(player))
    return Rect{};
  const auto& t = registry.get<Transform>(player);
  const auto& box = registry.get<AABB>(player);
  return Rect{t.pos.x, t.pos.y, box.w, box.h};
}

void World::update(SimContext& ctx, const ActionState& actions, TimeStep ts) {
  if (player != kInvalidEntity && registry.valid(player)) {
    auto& snap = registry.get<InputSnapshot>(player);
    snap.current = actions;
    snap.previous = previousActions;
  }

  Systems::sceneTransitions(*this, ctx);
  Systems::movement(*this, ctx, ts);
  Systems::clampToBounds(*this, ctx);
  Systems::followCamera(*this, ctx);
  Systems::interact(*this, ctx);
  Systems::switchCharacter(*this);

  previousActions = actions;
}
