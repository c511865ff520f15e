#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "ecs/Components.h"

// Shell-level commands; never reach the simulation.
struct AppCommands {
  bool quit = false;
  bool toggleOverlay = false;
  bool toggleCollision = false;
  bool cycleScene = false;
};

// Captures keyboard/gamepad state from SDL events. Gameplay actions are reported
// as held flags; pressed edges are derived by the World from its previous-tick
// buffer, so sampling here stays stateless.
class Input {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  [[nodiscard]] const char* gamepadName() const;
  void appendLegend(std::vector<std::string>& out) const;

  [[nodiscard]] ActionState actions() const { return actions_; }

  // Consume edge-triggered shell commands.
  AppCommands consumeCommands();

 private:
  void updateDerivedActions();
  void clearGamepadState();
  void tryOpenFirstGamepad();
  bool* buttonSlot(SDL_GamepadButton button);

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  ActionState actions_{};
  AppCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  uint32_t gamepadId_ = 0;
  int axisLeftX_ = 0;
  int axisLeftY_ = 0;
  bool dpadLeft_ = false;
  bool dpadRight_ = false;
  bool dpadUp_ = false;
  bool dpadDown_ = false;
  bool btnSouth_ = false;  // interact
  bool btnWest_ = false;   // switch character

  bool escHeld_ = false;
  bool overlayHeld_ = false;
  bool collisionHeld_ = false;
  bool cycleHeld_ = false;
};
