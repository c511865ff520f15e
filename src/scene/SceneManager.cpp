#include "scene/SceneManager.h"

#include <cstdio>
#include <exception>
#include <utility>

#include "scene/CollisionSystem.h"

namespace {

bool isReady(const std::shared_future<SceneFetch>& f) {
  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

const std::string kNoName;

}  // namespace

SceneManager::SceneManager(AssetSource& assets, CollisionSystem& collision)
    : assets_(assets), collision_(collision) {}

// Releasing the last reference to a std::async future joins its loader thread, so
// outstanding fetches finish before assets_ can go away.
SceneManager::~SceneManager() = default;

SceneManager::FetchFuture SceneManager::fetch(const std::string& name) {
  if (auto it = inFlight_.find(name); it != inFlight_.end())
    return it->second;

  AssetSource* assets = &assets_;
  FetchFuture f = std::async(std::launch::async,
                             [assets, name]() -> SceneFetch {
                               try {
                                 return assets->fetchScene(name);
                               } catch (const std::exception& e) {
                                 SceneFetch out{};
                                 out.error = SceneError::AssetLoadFailure;
                                 out.message = e.what();
                                 return out;
                               }
                             })
                      .share();
  inFlight_.emplace(name, f);
  return f;
}

void SceneManager::pruneFinished() {
  for (auto it = inFlight_.begin(); it != inFlight_.end();) {
    if (isReady(it->second))
      it = inFlight_.erase(it);
    else
      ++it;
  }
}

bool SceneManager::loadScene(const std::string& name, std::optional<Vec2> spawn) {
  if (pending_) {
    std::printf("scene transition to '%s' ignored: '%s' is still loading\n", name.c_str(),
                pending_->name.c_str());
    return false;
  }

  pending_ = PendingTransition{name, spawn, fetch(name)};
  return true;
}

void SceneManager::prefetch(const std::string& name) {
  (void)fetch(name);
}

std::optional<SceneLoadResult> SceneManager::poll() {
  if (!pending_ || !isReady(pending_->fetch)) {
    pruneFinished();
    return std::nullopt;
  }

  const PendingTransition done = std::move(*pending_);
  pending_.reset();
  SceneLoadResult result = apply(done, done.fetch.get());
  pruneFinished();
  return result;
}

SceneLoadResult SceneManager::loadSceneBlocking(const std::string& name,
                                                std::optional<Vec2> spawn) {
  if (pending_) {
    std::printf("blocking load of '%s' refused: '%s' is still loading\n", name.c_str(),
                pending_->name.c_str());
    SceneLoadResult out{};
    out.error = SceneError::TransitionPending;
    out.name = name;
    out.message = "transition to '" + pending_->name + "' has not resolved";
    return out;
  }

  pending_ = PendingTransition{name, spawn, fetch(name)};
  pending_->fetch.wait();
  std::optional<SceneLoadResult> result = poll();
  if (!result) {
    SceneLoadResult out{};
    out.error = SceneError::AssetLoadFailure;
    out.name = name;
    out.message = "load did not complete";
    return out;
  }
  return std::move(*result);
}

bool SceneManager::waitPending(std::chrono::milliseconds timeout) const {
  if (!pending_)
    return true;
  return pending_->fetch.wait_for(timeout) == std::future_status::ready;
}

const std::string& SceneManager::pendingName() const {
  return pending_ ? pending_->name : kNoName;
}

const std::string& SceneManager::activeName() const {
  return active_ ? active_->name : kNoName;
}

bool SceneManager::activeBounds(Rect& out) const {
  if (!active_ || !active_->meta.hasBounds())
    return false;
  out = active_->meta.bounds();
  return true;
}

SceneLoadResult SceneManager::apply(const PendingTransition& pending, const SceneFetch& fetched) {
  SceneLoadResult result{};
  result.name = pending.name;
  result.spawn = pending.spawn;

  if (!fetched.ok()) {
    result.error =
        (fetched.error == SceneError::None) ? SceneError::AssetLoadFailure : fetched.error;
    result.message = fetched.message;
    return result;
  }

  auto scene = std::make_shared<Scene>();
  scene->name = pending.name;
  scene->background = fetched.assets->background;
  scene->meta = fetched.assets->meta;

  collision_.loadFromMetadata(scene->meta);
  active_ = scene;
  result.scene = std::move(scene);

  std::printf("scene loaded: %s (%zu colliders, %zu interactives, %.0Fx%.0F)\n",
              pending.name.c_str(), active_->meta.colliders.size(),
              active_->meta.interactives.size(), static_cast<double>(active_->meta.width),
              static_cast<double>(active_->meta.height));
  return result;
}
