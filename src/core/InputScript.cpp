#include "core/InputScript.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

struct ActionField {
  const char* key;
  const char* alias;
  uint32_t bit;
  bool ActionState::*member;
};

constexpr std::array<ActionField, 6> kFields = {{
    {"left", nullptr, 1U << 0U, &ActionState::left},
    {"right", nullptr, 1U << 1U, &ActionState::right},
    {"up", nullptr, 1U << 2U, &ActionState::up},
    {"down", nullptr, 1U << 3U, &ActionState::down},
    {"interact", nullptr, 1U << 4U, &ActionState::interact},
    {"switch", "switch_character", 1U << 5U, &ActionState::switchCharacter},
}};

}  // namespace

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(pathStr.c_str(), "failed to parse input script: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root",
                            {"version", "keyframes", "frames", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    const std::filesystem::path includePath = normalized.parent_path() / *include;
    if (!appendFromToml(includePath, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::node* framesNode = TomlUtil::findAny(tbl, {"keyframes", "frames"});
  const toml::array* framesArr = framesNode ? framesNode->as_array() : nullptr;
  if (!framesArr)
    return true;

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    const std::string scope = "keyframes[" + std::to_string(idx++) + "]";
    auto t = node.as_table();
    if (!t) {
      TomlUtil::warnf(pathStr.c_str(), "{} is not a table", scope);
      continue;
    }

    TomlUtil::warnUnknownKeys(
        *t, pathStr.c_str(), scope,
        {"frame", "at", "left", "right", "up", "down", "interact", "switch", "switch_character"});

    const toml::node* frameNode = TomlUtil::findAny(*t, {"frame", "at"});
    const int64_t f = frameNode ? frameNode->value_or(int64_t{-1}) : -1;
    if (f < 0) {
      TomlUtil::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(f);
    for (const ActionField& field : kFields) {
      const toml::node* v = t->get(field.key);
      if (!v && field.alias)
        v = t->get(field.alias);
      if (!v)
        continue;
      auto b = v->value<bool>();
      if (!b) {
        TomlUtil::warnf(pathStr.c_str(), "{}.{} must be a boolean", scope, field.key);
        continue;
      }
      kf.mask |= field.bit;
      kf.values.*field.member = *b;
    }

    keyframes_.push_back(kf);
  }

  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }

  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  held_ = ActionState{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

uint64_t InputScript::lastKeyframe() const {
  return keyframes_.empty() ? 0 : keyframes_.back().frame;
}

// Frames are expected to be sampled in increasing order; going backwards
// restarts the script from frame 0.
ActionState InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return ActionState{};

  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    for (const ActionField& field : kFields) {
      if ((kf.mask & field.bit) != 0U)
        held_.*field.member = kf.values.*field.member;
    }
    ++nextIndex_;
  }

  lastFrame_ = frame;
  hasLastFrame_ = true;
  return held_;
}
