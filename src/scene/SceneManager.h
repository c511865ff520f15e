#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "scene/AssetSource.h"
#include "util/Geometry.h"

class CollisionSystem;

// A published scene. Never mutated after creation; a transition replaces it.
struct Scene {
  std::string name;
  std::string background;
  SceneMetadata meta;
};

struct SceneLoadResult {
  SceneError error = SceneError::None;
  std::string name;
  std::string message;
  std::shared_ptr<const Scene> scene;
  std::optional<Vec2> spawn;  // passed through from the request, not validated

  [[nodiscard]] bool ok() const { return error == SceneError::None && scene != nullptr; }
};

// Owns the active scene and feeds its geometry to the collision system.
//
// Loads are asynchronous: loadScene() starts a fetch on a loader thread and the
// result is applied by poll() on the simulation thread. Until then the previous
// scene (and its colliders) stays active. Only one transition may be pending;
// further requests are ignored until it resolves. Fetches are memoized per name
// while in flight, so a prefetch and a transition to the same scene share one
// read.
class SceneManager {
 public:
  SceneManager(AssetSource& assets, CollisionSystem& collision);
  ~SceneManager();

  SceneManager(const SceneManager&) = delete;
  SceneManager& operator=(const SceneManager&) = delete;

  bool loadScene(const std::string& name, std::optional<Vec2> spawn = std::nullopt);
  void prefetch(const std::string& name);

  // Applies the pending transition if its fetch finished. Never blocks.
  std::optional<SceneLoadResult> poll();

  // Starts (or joins) a load and waits for it. Used for the first scene.
  // Refused with TransitionPending while another transition is outstanding.
  SceneLoadResult loadSceneBlocking(const std::string& name,
                                    std::optional<Vec2> spawn = std::nullopt);

  // Test/tooling helper: waits up to `timeout` for the pending fetch to finish
  // without applying it. Returns true if nothing is pending or it finished.
  bool waitPending(std::chrono::milliseconds timeout) const;

  [[nodiscard]] bool transitionPending() const { return pending_.has_value(); }
  [[nodiscard]] const std::string& pendingName() const;
  [[nodiscard]] std::size_t inFlightCount() const { return inFlight_.size(); }

  [[nodiscard]] bool hasActiveScene() const { return active_ != nullptr; }
  [[nodiscard]] const Scene* activeScene() const { return active_.get(); }
  [[nodiscard]] const std::string& activeName() const;
  bool activeBounds(Rect& out) const;

 private:
  using FetchFuture = std::shared_future<SceneFetch>;

  struct PendingTransition {
    std::string name;
    std::optional<Vec2> spawn;
    FetchFuture fetch;
  };

  FetchFuture fetch(const std::string& name);
  void pruneFinished();
  SceneLoadResult apply(const PendingTransition& pending, const SceneFetch& fetched);

  AssetSource& assets_;
  CollisionSystem& collision_;
  std::unordered_map<std::string, FetchFuture> inFlight_;
  std::optional<PendingTransition> pending_;
  std::shared_ptr<const Scene> active_;
};
