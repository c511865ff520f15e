#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Plain data the App fills each frame; DebugUI never reaches into the World.
struct DebugUIOverlayModel {
  uint64_t frame = 0;
  float dtMs = 0.0F;
  float fps = 0.0F;
  bool debugCollision = false;

  std::string sceneName;
  std::string pendingScene;  // empty = none
  float sceneW = 0.0F;
  float sceneH = 0.0F;
  std::size_t colliderCount = 0;
  std::size_t interactiveCount = 0;

  bool hasPlayer = false;
  float posX = 0.0F;
  float posY = 0.0F;
  float playerW = 0.0F;
  float playerH = 0.0F;
  const char* facing = "";
  const char* moveState = "";
  std::string character;

  float camX = 0.0F;
  float camY = 0.0F;
  float camW = 0.0F;
  float camH = 0.0F;

  bool hasMouse = false;
  float mouseWorldX = 0.0F;
  float mouseWorldY = 0.0F;

  int transitionRequests = 0;
  int transitionsCompleted = 0;
  int transitionFailures = 0;
  int characterSwitches = 0;
  int blockedMoves = 0;
  int tomlWarnings = 0;

  const std::vector<std::string>* sceneNames = nullptr;
  std::vector<std::string> legend;
};

struct DebugUIActions {
  bool loadScene = false;
  std::string sceneName;
  bool toggleCollision = false;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  bool wantCaptureKeyboard() const;

  DebugUIActions drawOverlay(const DebugUIOverlayModel& model);

 private:
  bool initialized_ = false;
  int selectedScene_ = 0;
};
