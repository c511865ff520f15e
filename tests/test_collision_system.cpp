#include <gtest/gtest.h>

#include "scene/CollisionSystem.h"
#include "TestSupport.h"

namespace {

SceneMetadata twoWalls() {
  SceneMetadata m = makeMeta(800, 600);
  m.colliders.push_back(Collider{Rect{100, 100, 50, 50}});
  m.colliders.push_back(Collider{Rect{300, 0, 20, 600}});
  return m;
}

}  // namespace

TEST(CollisionSystem, StartsEmpty) {
  CollisionSystem cs;
  EXPECT_EQ(cs.colliderCount(), 0U);
  EXPECT_EQ(cs.interactiveCount(), 0U);
  EXPECT_FALSE(cs.isBlocked(Rect{0, 0, 1000, 1000}));
  EXPECT_EQ(cs.findInteractive(Rect{0, 0, 1000, 1000}), nullptr);
}

TEST(CollisionSystem, BlockedIffOverlap) {
  CollisionSystem cs;
  cs.loadFromMetadata(twoWalls());

  EXPECT_TRUE(cs.isBlocked(Rect{120, 120, 10, 10}));
  EXPECT_TRUE(cs.isBlocked(Rect{290, 200, 20, 20}));
  EXPECT_FALSE(cs.isBlocked(Rect{0, 0, 50, 50}));
  // Flush against the wall's left edge.
  EXPECT_FALSE(cs.isBlocked(Rect{280, 200, 20, 20}));
  // Flush below the box.
  EXPECT_FALSE(cs.isBlocked(Rect{100, 150, 50, 50}));
}

TEST(CollisionSystem, DegenerateCollidersNeverBlock) {
  SceneMetadata m = makeMeta(800, 600);
  m.colliders.push_back(Collider{Rect{0, 0, 0, 0}});
  m.colliders.push_back(Collider{Rect{50, 50, 0, 100}});

  CollisionSystem cs;
  cs.loadFromMetadata(m);
  EXPECT_EQ(cs.colliderCount(), 2U);
  EXPECT_FALSE(cs.isBlocked(Rect{0, 0, 800, 600}));
}

TEST(CollisionSystem, FindInteractiveReturnsFirstInListOrder) {
  SceneMetadata m = makeMeta(800, 600);
  m.interactives.push_back(makeDoor(Rect{0, 0, 100, 100}, "a"));
  m.interactives.push_back(makeDoor(Rect{50, 50, 100, 100}, "b"));

  CollisionSystem cs;
  cs.loadFromMetadata(m);

  const Interactive* hit = cs.findInteractive(Rect{60, 60, 10, 10});
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(hit->destinationScene, "a");

  hit = cs.findInteractive(Rect{120, 120, 10, 10});
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(hit->destinationScene, "b");

  EXPECT_EQ(cs.findInteractive(Rect{400, 400, 10, 10}), nullptr);
}

TEST(CollisionSystem, LoadReplacesPreviousSceneWholesale) {
  CollisionSystem cs;
  cs.loadFromMetadata(twoWalls());
  ASSERT_TRUE(cs.isBlocked(Rect{120, 120, 10, 10}));

  SceneMetadata other = makeMeta(400, 400);
  other.interactives.push_back(makeDoor(Rect{0, 0, 10, 10}, "x"));
  cs.loadFromMetadata(other);

  EXPECT_EQ(cs.colliderCount(), 0U);
  EXPECT_EQ(cs.interactiveCount(), 1U);
  EXPECT_FALSE(cs.isBlocked(Rect{120, 120, 10, 10}));

  cs.loadFromMetadata(SceneMetadata{});
  EXPECT_EQ(cs.interactiveCount(), 0U);
}

TEST(CollisionSystem, ClearEmptiesBothLists) {
  CollisionSystem cs;
  SceneMetadata m = twoWalls();
  m.interactives.push_back(makeDoor(Rect{0, 0, 10, 10}, "x"));
  cs.loadFromMetadata(m);
  cs.clear();
  EXPECT_EQ(cs.colliderCount(), 0U);
  EXPECT_EQ(cs.interactiveCount(), 0U);
}
