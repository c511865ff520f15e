#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "scene/AssetSource.h"

// Scratch directory removed at scope exit.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("scenewalk_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  std::string write(const std::string& rel, std::string_view contents) const {
    const std::filesystem::path p = path_ / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << contents;
    return p.string();
  }

 private:
  std::filesystem::path path_;
};

// In-memory asset source. When gated, fetches block until open() is called,
// which lets tests observe a transition while it is still pending.
class FakeAssets : public AssetSource {
 public:
  FakeAssets() : gate_(gatePromise_.get_future().share()) {}

  ~FakeAssets() override { open(); }

  void add(const std::string& name, SceneMetadata meta, std::string background = {}) {
    auto assets = std::make_shared<SceneAssets>();
    assets->meta = std::move(meta);
    assets->background = std::move(background);
    std::lock_guard<std::mutex> lock(mutex_);
    scenes_[name] = std::move(assets);
  }

  void failWith(const std::string& name, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[name] = std::move(message);
  }

  void setGated(bool gated) { gated_ = gated; }

  void open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
      opened_ = true;
      gatePromise_.set_value();
    }
  }

  SceneFetch fetchScene(const std::string& name) override {
    ++fetches_;
    if (gated_)
      gate_.wait();

    std::lock_guard<std::mutex> lock(mutex_);
    SceneFetch out{};
    if (auto f = failures_.find(name); f != failures_.end()) {
      out.error = SceneError::AssetLoadFailure;
      out.message = f->second;
      return out;
    }
    auto it = scenes_.find(name);
    if (it == scenes_.end()) {
      out.error = SceneError::SceneNotFound;
      out.message = "unknown scene " + name;
      return out;
    }
    out.assets = it->second;
    return out;
  }

  [[nodiscard]] int fetches() const { return fetches_.load(); }

 private:
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const SceneAssets>> scenes_;
  std::map<std::string, std::string> failures_;
  std::promise<void> gatePromise_;
  std::shared_future<void> gate_;
  std::atomic<bool> gated_{false};
  std::atomic<int> fetches_{0};
  bool opened_ = false;
};

// Declare after the SceneManager under test: opens the gate first on scope exit
// so the manager's loader threads can finish and be joined.
struct OpenGateOnExit {
  FakeAssets& assets;
  ~OpenGateOnExit() { assets.open(); }
};

inline SceneMetadata makeMeta(float w, float h) {
  SceneMetadata m;
  m.width = w;
  m.height = h;
  return m;
}

inline Interactive makeDoor(Rect r, std::string dest, std::optional<Vec2> spawn = std::nullopt) {
  Interactive it;
  it.rect = r;
  it.type = "door";
  it.destinationScene = std::move(dest);
  it.spawnPoint = spawn;
  return it;
}
