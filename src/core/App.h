#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/DebugUI.h"
#include "core/GameConfig.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/TextureCache.h"
#include "core/Time.h"
#include "ecs/World.h"
#include "scene/Camera.h"
#include "scene/CollisionSystem.h"
#include "scene/ManifestAssets.h"
#include "scene/SceneManager.h"

struct AppConfig {
  const char* configPath = nullptr;  // default: config/game.toml
  const char* manifestPath = nullptr;
  const char* sceneName = nullptr;
  const char* inputScriptTomlPath = nullptr;
  const char* argv0 = nullptr;
  int width = 0;  // 0 = from config
  int height = 0;
  bool noUi = false;
};

class App {
 public:
  struct PlayerSnapshot {
    bool valid = false;
    float x = 0.0F;
    float y = 0.0F;
    float camX = 0.0F;
    float camY = 0.0F;
    std::string scene;
    std::string character;
  };

  bool init(const AppConfig& cfg);
  void run(int maxFrames = -1);
  void shutdown();

  bool playerSnapshot(PlayerSnapshot& out) const;
  bool hasInputScript() const { return inputScriptEnabled_; }

 private:
  void handleEvent(const SDL_Event& e);
  void handleCommands(const AppCommands& cmds);
  void tick(TimeStep ts);
  void requestScene(const std::string& name);
  void cycleScene();

  void render();
  bool ensureGameTarget();
  void renderBackground();
  void renderCollisionDebug();
  void renderPlayer();
  void renderHud();
  void renderDebugOverlay();
  SDL_FRect gameDestRect(int winW, int winH) const;

  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  SDL_Texture* gameTarget_ = nullptr;
  int viewW_ = static_cast<int>(CameraSystem::kDefaultViewW);
  int viewH_ = static_cast<int>(CameraSystem::kDefaultViewH);
  bool running_ = true;

  bool debugOverlay_ = false;
  bool debugCollision_ = false;
  bool uiEnabled_ = true;

  TimeStep lastTs_{};
  uint64_t simFrame_ = 0;
  float fps_ = 0.0F;

  GameConfig config_;
  std::vector<std::string> sceneNames_;

  // Declaration order matters: scenes_ refers to assets_ and collision_ and
  // must be destroyed (joining its loader threads) before them.
  ManifestAssets assets_;
  CollisionSystem collision_;
  CameraSystem camera_;
  std::unique_ptr<SceneManager> scenes_;
  World world_;

  Input input_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;
  DebugUI debugUi_;
  TextureCache textures_;
};
