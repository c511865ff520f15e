#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "ecs/Components.h"

// Scripted input for smoke runs and tests. A script is a list of keyframes;
// each keyframe sets some actions from its frame onward, and actions it does
// not mention keep their previous value:
//
//   version = 1
//   [[keyframes]]
//   frame = 0
//   right = true
//   [[keyframes]]
//   frame = 30
//   right = false
//   interact = true
class InputScript {
 public:
  bool loadFromToml(const char* path);
  void reset();
  ActionState sample(uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }
  // Frame of the last keyframe, or 0 when empty.
  [[nodiscard]] uint64_t lastKeyframe() const;

 private:
  struct Keyframe {
    uint64_t frame = 0;
    uint32_t mask = 0;
    ActionState values{};
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);

  std::vector<Keyframe> keyframes_;
  ActionState held_{};
  std::size_t nextIndex_ = 0;
  uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
