#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include "ecs/World.h"
#include "scene/Camera.h"
#include "scene/CollisionSystem.h"
#include "scene/SceneManager.h"
#include "TestSupport.h"

using namespace std::chrono_literals;

namespace {

constexpr TimeStep kStep{50.0F, 0};

ActionState moving(bool up, bool down, bool left, bool right) {
  ActionState a{};
  a.up = up;
  a.down = down;
  a.left = left;
  a.right = right;
  return a;
}

ActionState interacting() {
  ActionState a{};
  a.interact = true;
  return a;
}

ActionState switching() {
  ActionState a{};
  a.switchCharacter = true;
  return a;
}

// World plus its collaborators, without a scene manager unless one is attached.
struct Sim {
  CollisionSystem collision;
  CameraSystem camera{640.0F, 480.0F};
  World world;
  SimContext ctx{collision, camera, nullptr, Rect{0.0F, 0.0F, 640.0F, 480.0F}};

  explicit Sim(Vec2 start, float w = 96.0F, float h = 96.0F) {
    world.spawnPlayer(start, w, h, 0.2F, {"Dixon_Water", "Dixon_Floral", "alien_dude"});
  }

  void step(const ActionState& a, TimeStep ts = kStep) { world.update(ctx, a, ts); }

  [[nodiscard]] Vec2 pos() const { return world.registry.get<Transform>(world.player).pos; }
  [[nodiscard]] MoveState state() const { return world.registry.get<MoveState>(world.player); }
  [[nodiscard]] Facing facing() const { return world.registry.get<Facing>(world.player); }
  [[nodiscard]] std::size_t characterIndex() const {
    return world.registry.get<CharacterRoster>(world.player).index;
  }
};

}  // namespace

TEST(Simulation, SpawnedPlayerHasDefaults) {
  Sim sim(Vec2{10, 20});
  EXPECT_EQ(sim.pos(), (Vec2{10, 20}));
  EXPECT_EQ(sim.facing(), Facing::Down);
  EXPECT_EQ(sim.state(), MoveState::Idle);
  const Rect r = sim.world.playerRect();
  EXPECT_FLOAT_EQ(r.w, 96.0F);
  EXPECT_FLOAT_EQ(r.h, 96.0F);
}

TEST(Simulation, MovesBySpeedTimesDt) {
  Sim sim(Vec2{100, 100});
  sim.step(moving(false, false, false, true));
  EXPECT_FLOAT_EQ(sim.pos().x, 110.0F);
  EXPECT_FLOAT_EQ(sim.pos().y, 100.0F);
  EXPECT_EQ(sim.state(), MoveState::Walking);
  EXPECT_EQ(sim.facing(), Facing::Right);
}

// A 24px-wide body: the first step ends 6px short of the post, the second would
// overlap it by 4px.
TEST(Simulation, StopsAgainstColliderWithoutEnteringIt) {
  Sim sim(Vec2{100, 100}, 24.0F, 96.0F);
  SceneMetadata meta = makeMeta(800, 600);
  meta.colliders.push_back(Collider{Rect{140, 90, 20, 40}});
  sim.collision.loadFromMetadata(meta);

  const ActionState right = moving(false, false, false, true);
  sim.step(right);
  EXPECT_FLOAT_EQ(sim.pos().x, 110.0F);
  EXPECT_EQ(sim.state(), MoveState::Walking);

  sim.step(right);
  EXPECT_FLOAT_EQ(sim.pos().x, 110.0F);
  EXPECT_FLOAT_EQ(sim.pos().y, 100.0F);
  EXPECT_EQ(sim.state(), MoveState::Idle);
  EXPECT_EQ(sim.world.blockedMoves, 1);
  EXPECT_FALSE(sim.collision.isBlocked(sim.world.playerRect()));
}

TEST(Simulation, FullSizeBodyBlockedByColliderAhead) {
  Sim sim(Vec2{100, 100});
  SceneMetadata meta = makeMeta(800, 600);
  meta.colliders.push_back(Collider{Rect{206, 90, 20, 40}});
  sim.collision.loadFromMetadata(meta);

  // {110,100,96,96} ends flush at 206; {120,100,96,96} overlaps.
  sim.step(moving(false, false, false, true));
  EXPECT_FLOAT_EQ(sim.pos().x, 110.0F);
  sim.step(moving(false, false, false, true));
  EXPECT_FLOAT_EQ(sim.pos().x, 110.0F);
  EXPECT_EQ(sim.state(), MoveState::Idle);
}

TEST(Simulation, BlockedMoveKeepsFacing) {
  Sim sim(Vec2{100, 100});
  SceneMetadata meta = makeMeta(800, 600);
  meta.colliders.push_back(Collider{Rect{100, 90, 96, 8}});
  sim.collision.loadFromMetadata(meta);

  sim.step(moving(true, false, false, false));
  EXPECT_EQ(sim.pos(), (Vec2{100, 100}));
  EXPECT_EQ(sim.facing(), Facing::Down);
}

TEST(Simulation, OppositeInputsCancel) {
  Sim sim(Vec2{100, 100});
  sim.step(moving(false, false, false, true));
  sim.step(moving(true, true, true, true));
  EXPECT_EQ(sim.pos(), (Vec2{110, 100}));
  EXPECT_EQ(sim.state(), MoveState::Idle);
  EXPECT_EQ(sim.facing(), Facing::Right);
}

TEST(Simulation, DiagonalMovementIsNormalized) {
  Sim sim(Vec2{200, 200});
  sim.step(moving(true, false, false, true));
  const float dx = sim.pos().x - 200.0F;
  const float dy = sim.pos().y - 200.0F;
  EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), 10.0F, 1e-3F);
  EXPECT_GT(dx, 0.0F);
  EXPECT_LT(dy, 0.0F);
  // Equal axes: vertical wins.
  EXPECT_EQ(sim.facing(), Facing::Up);
}

TEST(Simulation, FacingFollowsDominantAxis) {
  Sim sim(Vec2{200, 200});
  sim.step(moving(false, false, true, false));
  EXPECT_EQ(sim.facing(), Facing::Left);
  sim.step(moving(false, true, false, false));
  EXPECT_EQ(sim.facing(), Facing::Down);
  sim.step(moving(true, false, false, false));
  EXPECT_EQ(sim.facing(), Facing::Up);
}

TEST(Simulation, ClampsToFallbackBoundsWithoutScene) {
  Sim sim(Vec2{5, 5});
  sim.step(moving(true, false, true, false));
  EXPECT_EQ(sim.pos(), (Vec2{0, 0}));

  Sim far(Vec2{540, 380});
  far.step(moving(false, true, false, true), TimeStep{1000.0F, 0});
  EXPECT_EQ(far.pos(), (Vec2{544, 384}));
}

TEST(Simulation, ClampsToActiveSceneBounds) {
  FakeAssets assets;
  assets.add("field", makeMeta(800, 600));
  Sim sim(Vec2{700, 500});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("field").ok());

  sim.step(moving(false, true, false, true), TimeStep{1000.0F, 0});
  EXPECT_EQ(sim.pos(), (Vec2{704, 504}));
  const Rect r = sim.world.playerRect();
  EXPECT_LE(r.right(), 800.0F);
  EXPECT_LE(r.bottom(), 600.0F);
}

TEST(Simulation, ClampedStepIsCheckedAgainstColliders) {
  FakeAssets assets;
  SceneMetadata field = makeMeta(800, 600);
  // Clear of the unclamped diagonal step (x ~707), hit by the clamped one (x 704).
  field.colliders.push_back(Collider{Rect{704, 197, 2, 5}});
  assets.add("field", field);
  Sim sim(Vec2{700, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("field").ok());

  sim.step(moving(false, true, false, true));
  EXPECT_EQ(sim.pos(), (Vec2{700, 100}));
  EXPECT_EQ(sim.state(), MoveState::Idle);
  EXPECT_EQ(sim.world.blockedMoves, 1);
  EXPECT_FALSE(sim.collision.isBlocked(sim.world.playerRect()));
}

TEST(Simulation, CameraFollowsPlayerCenterAndClamps) {
  FakeAssets assets;
  assets.add("field", makeMeta(800, 600));
  Sim sim(Vec2{0, 0});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("field").ok());

  sim.step(ActionState{});
  EXPECT_FLOAT_EQ(sim.camera.x(), 0.0F);
  EXPECT_FLOAT_EQ(sim.camera.y(), 0.0F);

  sim.world.registry.get<Transform>(sim.world.player).pos = Vec2{704, 504};
  sim.step(ActionState{});
  EXPECT_FLOAT_EQ(sim.camera.x(), 160.0F);
  EXPECT_FLOAT_EQ(sim.camera.y(), 120.0F);
}

TEST(Simulation, CameraUnclampedWithoutSceneBounds) {
  Sim sim(Vec2{0, 0});
  sim.step(ActionState{});
  // Center (48,48) minus half the viewport.
  EXPECT_FLOAT_EQ(sim.camera.x(), -272.0F);
  EXPECT_FLOAT_EQ(sim.camera.y(), -192.0F);
}

TEST(Simulation, HeldInteractTriggersOneTransitionOnPressTick) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  hall.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "yard"));
  assets.add("hall", hall);
  assets.add("yard", makeMeta(800, 600));
  assets.setGated(true);

  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  OpenGateOnExit gate{assets};
  ASSERT_TRUE(scenes.loadScene("hall"));
  assets.open();
  ASSERT_TRUE(scenes.waitPending(2s));
  sim.step(ActionState{});
  ASSERT_EQ(scenes.activeName(), "hall");

  sim.step(ActionState{});
  EXPECT_EQ(sim.world.transitionRequests, 0);

  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 1);
  EXPECT_EQ(scenes.pendingName(), "yard");

  ASSERT_TRUE(scenes.waitPending(2s));
  for (int i = 0; i < 5; ++i)
    sim.step(interacting());

  EXPECT_EQ(sim.world.transitionRequests, 1);
  EXPECT_EQ(sim.world.transitionsCompleted, 2);
  EXPECT_EQ(scenes.activeName(), "yard");
}

TEST(Simulation, HeldInteractOnDoorAfterFailedLoadDoesNotRepeat) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  hall.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "nowhere"));
  assets.add("hall", hall);

  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("hall").ok());

  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 1);
  ASSERT_TRUE(scenes.waitPending(2s));

  // Still on the door with nothing pending: holding must not re-request.
  for (int i = 0; i < 5; ++i) {
    sim.step(interacting());
    EXPECT_FALSE(scenes.transitionPending());
  }
  EXPECT_EQ(sim.world.transitionFailures, 1);
  EXPECT_EQ(sim.world.transitionRequests, 1);
  EXPECT_EQ(scenes.activeName(), "hall");

  sim.step(ActionState{});
  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 2);
  ASSERT_TRUE(scenes.waitPending(2s));
  sim.step(ActionState{});
  EXPECT_EQ(sim.world.transitionFailures, 2);
}

TEST(Simulation, InteractIgnoredAwayFromDoorsAndOnNonDoors) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  Interactive sign;
  sign.rect = Rect{90, 90, 40, 40};
  sign.type = "sign";
  sign.destinationScene = "yard";
  hall.interactives.push_back(sign);
  hall.interactives.push_back(makeDoor(Rect{600, 400, 40, 40}, "yard"));
  assets.add("hall", hall);
  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("hall").ok());

  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 0);
  EXPECT_FALSE(scenes.transitionPending());
}

TEST(Simulation, DoorWithSpawnPointRepositionsPlayer) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  hall.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "yard", Vec2{300, 250}));
  assets.add("hall", hall);
  assets.add("yard", makeMeta(1000, 1000));

  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("hall").ok());

  sim.step(interacting());
  ASSERT_TRUE(scenes.waitPending(2s));
  sim.step(ActionState{});

  EXPECT_EQ(scenes.activeName(), "yard");
  EXPECT_EQ(sim.pos(), (Vec2{300, 250}));
}

TEST(Simulation, DoorWithoutSpawnPointKeepsPosition) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  hall.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "yard"));
  assets.add("hall", hall);
  assets.add("yard", makeMeta(1000, 1000));

  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("hall").ok());

  sim.step(interacting());
  ASSERT_TRUE(scenes.waitPending(2s));
  sim.step(ActionState{});
  EXPECT_EQ(scenes.activeName(), "yard");
  EXPECT_EQ(sim.pos(), (Vec2{100, 100}));
}

TEST(Simulation, TransitionToMissingSceneChangesNothing) {
  FakeAssets assets;
  SceneMetadata hall = makeMeta(800, 600);
  hall.colliders.push_back(Collider{Rect{400, 400, 50, 50}});
  hall.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "nowhere", Vec2{1, 1}));
  assets.add("hall", hall);

  Sim sim(Vec2{100, 100});
  SceneManager scenes(assets, sim.collision);
  sim.ctx.scenes = &scenes;
  ASSERT_TRUE(scenes.loadSceneBlocking("hall").ok());
  const Scene* before = scenes.activeScene();

  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 1);
  ASSERT_TRUE(scenes.waitPending(2s));
  sim.step(ActionState{});

  EXPECT_EQ(sim.world.transitionFailures, 1);
  EXPECT_EQ(scenes.activeScene(), before);
  EXPECT_EQ(sim.pos(), (Vec2{100, 100}));
  EXPECT_EQ(sim.collision.colliderCount(), 1U);
  EXPECT_TRUE(sim.collision.isBlocked(Rect{410, 410, 5, 5}));
}

TEST(Simulation, CharacterSwitchIsEdgeTriggeredAndCyclic) {
  Sim sim(Vec2{100, 100});
  EXPECT_EQ(sim.characterIndex(), 0U);

  sim.step(switching());
  sim.step(switching());
  sim.step(switching());
  EXPECT_EQ(sim.characterIndex(), 1U);

  sim.step(ActionState{});
  sim.step(switching());
  EXPECT_EQ(sim.characterIndex(), 2U);

  sim.step(ActionState{});
  sim.step(switching());
  EXPECT_EQ(sim.characterIndex(), 0U);
  EXPECT_EQ(sim.world.characterSwitches, 3);
}

TEST(Simulation, EmptyRosterIgnoresSwitch) {
  CollisionSystem collision;
  CameraSystem camera;
  World world;
  world.spawnPlayer(Vec2{0, 0}, 96, 96, 0.2F, {});
  SimContext ctx{collision, camera, nullptr, Rect{0, 0, 640, 480}};
  world.update(ctx, switching(), kStep);
  EXPECT_EQ(world.characterSwitches, 0);
  EXPECT_EQ(world.registry.get<CharacterRoster>(world.player).current(), "");
}

TEST(Simulation, PreviousActionsAdvanceOncePerTick) {
  Sim sim(Vec2{100, 100});
  const ActionState a = interacting();
  sim.step(a);
  EXPECT_TRUE(sim.world.previousActions.interact);
  sim.step(ActionState{});
  EXPECT_FALSE(sim.world.previousActions.interact);
}

TEST(Simulation, InteractWithoutSceneManagerIsHarmless) {
  Sim sim(Vec2{100, 100});
  SceneMetadata meta = makeMeta(800, 600);
  meta.interactives.push_back(makeDoor(Rect{90, 90, 40, 40}, "yard"));
  sim.collision.loadFromMetadata(meta);
  sim.step(interacting());
  EXPECT_EQ(sim.world.transitionRequests, 0);
}
