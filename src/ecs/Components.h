#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/Geometry.h"

struct Transform {
  Vec2 pos{};
};

struct AABB {
  float w = 96.0F;
  float h = 96.0F;
};

struct MoveSpeed {
  float pxPerMs = 0.2F;
};

// Stored directly as components on the player entity.
enum class Facing : std::uint8_t { Down, Up, Left, Right };
enum class MoveState : std::uint8_t { Idle, Walking };

// Characters the player can cycle through; presentation picks colors/sprites by name.
struct CharacterRoster {
  std::vector<std::string> names;
  std::size_t index = 0;

  [[nodiscard]] const std::string& current() const {
    static const std::string kNone;
    return names.empty() ? kNone : names[index % names.size()];
  }
};

struct PlayerTag {};

// Logical actions for one tick, as sampled by the input side.
struct ActionState {
  bool up = false;
  bool down = false;
  bool left = false;
  bool right = false;
  bool interact = false;
  bool switchCharacter = false;
};

// Current actions plus the previous tick's, for edge detection.
struct InputSnapshot {
  ActionState current{};
  ActionState previous{};

  [[nodiscard]] bool interactPressed() const { return current.interact && !previous.interact; }
  [[nodiscard]] bool switchPressed() const {
    return current.switchCharacter && !previous.switchCharacter;
  }
};

inline const char* facingName(Facing f) {
  switch (f) {
    case Facing::Down:
      return "down";
    case Facing::Up:
      return "up";
    case Facing::Left:
      return "left";
    case Facing::Right:
      return "right";
  }
  return "down";
}

inline const char* moveStateName(MoveState s) {
  return s == MoveState::Walking ? "walk" : "idle";
}
