#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <array>
#include <memory>

namespace {

// Keyboard bindings for held gameplay actions. Each action accepts a primary and
// an alternate key; the legend below reads from the same table.
struct KeyBinding {
  bool ActionState::*action;
  SDL_Scancode primary;
  SDL_Scancode alternate;
};

constexpr std::array<KeyBinding, 6> kKeyBindings{{
    {&ActionState::left, SDL_SCANCODE_A, SDL_SCANCODE_LEFT},
    {&ActionState::right, SDL_SCANCODE_D, SDL_SCANCODE_RIGHT},
    {&ActionState::up, SDL_SCANCODE_W, SDL_SCANCODE_UP},
    {&ActionState::down, SDL_SCANCODE_S, SDL_SCANCODE_DOWN},
    {&ActionState::interact, SDL_SCANCODE_E, SDL_SCANCODE_RETURN},
    {&ActionState::switchCharacter, SDL_SCANCODE_SPACE, SDL_SCANCODE_SPACE},
}};

const KeyBinding& bindingFor(bool ActionState::*action) {
  for (const KeyBinding& b : kKeyBindings) {
    if (b.action == action)
      return b;
  }
  return kKeyBindings.front();
}

constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kToggleOverlayKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kToggleOverlayAltKey = SDL_SCANCODE_F;
constexpr SDL_Scancode kToggleCollisionKey = SDL_SCANCODE_F2;
constexpr SDL_Scancode kCycleSceneKey = SDL_SCANCODE_B;

constexpr int kAxisDeadzone = 8000;
constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadAxis kMoveAxisY = SDL_GAMEPAD_AXIS_LEFTY;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kDpadUpButton = SDL_GAMEPAD_BUTTON_DPAD_UP;
constexpr SDL_GamepadButton kDpadDownButton = SDL_GAMEPAD_BUTTON_DPAD_DOWN;
constexpr SDL_GamepadButton kInteractButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kSwitchButton = SDL_GAMEPAD_BUTTON_WEST;

const char* keyLabel(SDL_Scancode sc) {
  const char* name = SDL_GetScancodeName(sc);
  return (name && *name) ? name : "?";
}

// Sets `flag` on the rising edge of `now` and remembers the level in `held`.
void commandEdge(bool now, bool& held, bool& flag) {
  if (now && !held)
    flag = true;
  held = now;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  axisLeftY_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  dpadUp_ = false;
  dpadDown_ = false;
  btnSouth_ = false;
  btnWest_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)> pads(SDL_GetGamepads(&count), SDL_free);
  for (int i = 0; pads && i < count && !gamepad_; ++i) {
    gamepad_ = SDL_OpenGamepad(pads.get()[i]);
    if (gamepad_)
      gamepadId_ = pads.get()[i];
  }
}

bool* Input::buttonSlot(SDL_GamepadButton button) {
  switch (button) {
    case kDpadLeftButton:
      return &dpadLeft_;
    case kDpadRightButton:
      return &dpadRight_;
    case kDpadUpButton:
      return &dpadUp_;
    case kDpadDownButton:
      return &dpadDown_;
    case kInteractButton:
      return &btnSouth_;
    case kSwitchButton:
      return &btnWest_;
    default:
      return nullptr;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

void Input::handleEvent(const SDL_Event& e) {
  switch (e.type) {
    case SDL_EVENT_GAMEPAD_ADDED:
      // Only one pad drives the player; later ones are ignored until it goes away.
      tryOpenFirstGamepad();
      return;
    case SDL_EVENT_GAMEPAD_REMOVED:
      if (gamepad_ && e.gdevice.which == gamepadId_) {
        shutdown();
        tryOpenFirstGamepad();
        updateDerivedActions();
      }
      return;
    case SDL_EVENT_GAMEPAD_AXIS_MOTION:
      if (!gamepad_ || e.gaxis.which != gamepadId_)
        return;
      if (e.gaxis.axis == kMoveAxisX)
        axisLeftX_ = static_cast<int>(e.gaxis.value);
      else if (e.gaxis.axis == kMoveAxisY)
        axisLeftY_ = static_cast<int>(e.gaxis.value);
      updateDerivedActions();
      return;
    default:
      break;
  }
  if (e.type == SDL_EVENT_GAMEPAD_BUTTON_DOWN || e.type == SDL_EVENT_GAMEPAD_BUTTON_UP) {
    if (!gamepad_ || e.gbutton.which != gamepadId_)
      return;
    if (bool* slot = buttonSlot(static_cast<SDL_GamepadButton>(e.gbutton.button))) {
      *slot = e.gbutton.down;
      updateDerivedActions();
    }
    return;
  }

  if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP)
    return;

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  scancodeDown_[sc] = e.key.down;
  updateDerivedActions();
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  return (name && *name) ? name : nullptr;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  std::string move = "Move: ";
  for (bool ActionState::*dir : {&ActionState::up, &ActionState::left, &ActionState::down,
                                 &ActionState::right}) {
    move += keyLabel(bindingFor(dir).primary);
  }
  out.push_back(move + " or arrows  (pad: D-pad / left stick)");

  const KeyBinding& interact = bindingFor(&ActionState::interact);
  out.push_back(std::string("Interact: ") + keyLabel(interact.primary) + "/" +
                keyLabel(interact.alternate) + "  (pad: South)");
  out.push_back(std::string("Switch character: ") +
                keyLabel(bindingFor(&ActionState::switchCharacter).primary) + "  (pad: West)");
  if (const char* pad = gamepadName())
    out.push_back(std::string("Pad connected: ") + pad);
  out.push_back(std::string("Next scene: ") + keyLabel(kCycleSceneKey) +
                "  Quit: " + keyLabel(kQuitKey));
  out.push_back(std::string("Toggles: ") + keyLabel(kToggleOverlayKey) + "/" +
                keyLabel(kToggleOverlayAltKey) + " overlay  " + keyLabel(kToggleCollisionKey) +
                " collision");
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::updateDerivedActions() {
  for (const KeyBinding& b : kKeyBindings)
    actions_.*b.action = scancodeDown_[b.primary] || scancodeDown_[b.alternate];

  const int dz = kAxisDeadzone;
  actions_.left = actions_.left || dpadLeft_ || axisLeftX_ < -dz;
  actions_.right = actions_.right || dpadRight_ || axisLeftX_ > dz;
  actions_.up = actions_.up || dpadUp_ || axisLeftY_ < -dz;
  actions_.down = actions_.down || dpadDown_ || axisLeftY_ > dz;
  actions_.interact = actions_.interact || btnSouth_;
  actions_.switchCharacter = actions_.switchCharacter || btnWest_;

  commandEdge(scancodeDown_[kQuitKey], escHeld_, commands_.quit);
  commandEdge(scancodeDown_[kToggleOverlayKey] || scancodeDown_[kToggleOverlayAltKey],
              overlayHeld_, commands_.toggleOverlay);
  commandEdge(scancodeDown_[kToggleCollisionKey], collisionHeld_, commands_.toggleCollision);
  commandEdge(scancodeDown_[kCycleSceneKey], cycleHeld_, commands_.cycleScene);
}
