#include "core/App.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

#include "ecs/Components.h"
#include "util/Paths.h"
#include "util/TomlUtil.h"

namespace {

constexpr float kScriptedDtMs = 1000.0F / 60.0F;
constexpr float kMaxDtMs = 250.0F;

struct Rgb {
  Uint8 r;
  Uint8 g;
  Uint8 b;
};

constexpr Rgb kSkyBlue{135, 206, 235};
constexpr Rgb kPaleGreen{152, 251, 152};

Rgb characterTint(const std::string& name) {
  if (name == "Dixon_Water")
    return Rgb{0, 100, 255};
  if (name == "Dixon_Floral")
    return Rgb{50, 200, 50};
  if (name == "alien_dude")
    return Rgb{128, 0, 128};
  if (name == "ghost_dude")
    return Rgb{255, 255, 255};
  return Rgb{128, 128, 128};
}

Uint8 lerpChannel(Uint8 a, Uint8 b, float t) {
  return static_cast<Uint8>(std::lround(static_cast<float>(a) + (static_cast<float>(b) - a) * t));
}

std::string displayName(std::string s) {
  std::replace(s.begin(), s.end(), '_', ' ');
  return s;
}

}  // namespace

bool App::init(const AppConfig& cfg) {
  uiEnabled_ = !cfg.noUi;

  const std::string configPath =
      Paths::resolveDataPath(cfg.configPath ? cfg.configPath : "config/game.toml", cfg.argv0);
  if (!config_.loadFromToml(configPath.c_str())) {
    if (cfg.configPath) {
      std::printf("failed to load config: %s\n", configPath.c_str());
      return false;
    }
    std::printf("config not found (%s); using defaults\n", configPath.c_str());
  }
  if (cfg.width > 0)
    config_.window.width = cfg.width;
  if (cfg.height > 0)
    config_.window.height = cfg.height;

  viewW_ = config_.viewport.width;
  viewH_ = config_.viewport.height;
  camera_ = CameraSystem(static_cast<float>(viewW_), static_cast<float>(viewH_));

  const std::string manifestPath = cfg.manifestPath
                                       ? Paths::resolveDataPath(cfg.manifestPath, cfg.argv0)
                                       : Paths::resolveDataPath(config_.manifestPath(), cfg.argv0);
  if (!assets_.load(manifestPath.c_str())) {
    // Not fatal: the player stays controllable inside the viewport without scenes.
    std::printf("failed to load manifest: %s\n", manifestPath.c_str());
  }
  sceneNames_ = assets_.sceneNames();
  scenes_ = std::make_unique<SceneManager>(assets_, collision_);

  std::vector<std::string> roster =
      config_.characters.empty() ? assets_.characters() : config_.characters;
  world_.spawnPlayer(Vec2{config_.player.startX, config_.player.startY}, config_.player.width,
                     config_.player.height, config_.player.speed, std::move(roster));

  std::string startScene = cfg.sceneName ? cfg.sceneName : config_.scenes.start;
  if (startScene.empty() && !sceneNames_.empty())
    startScene = sceneNames_.front();
  if (!startScene.empty()) {
    const SceneLoadResult res =
        scenes_->loadSceneBlocking(startScene, config_.scenes.startSpawn);
    if (res.ok()) {
      if (res.spawn)
        world_.registry.get<Transform>(world_.player).pos = *res.spawn;
    } else {
      std::printf("start scene '%s' failed (%s): %s\n", startScene.c_str(),
                  sceneErrorName(res.error), res.message.c_str());
    }
  }

  // Warm the loader for every door target of the first scene.
  for (const Interactive& it : collision_.interactives()) {
    if (it.isDoor() && !it.destinationScene.empty())
      scenes_->prefetch(it.destinationScene);
  }

  if (cfg.inputScriptTomlPath) {
    if (!inputScript_.loadFromToml(cfg.inputScriptTomlPath)) {
      std::printf("failed to load input script: %s\n", cfg.inputScriptTomlPath);
      return false;
    }
    inputScriptEnabled_ = true;
  }

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
    std::printf("SDL_Init failed: %s\n", SDL_GetError());
    return false;
  }

  window_ = SDL_CreateWindow(config_.window.title.c_str(), config_.window.width,
                             config_.window.height, SDL_WINDOW_RESIZABLE);
  if (!window_) {
    std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (renderer_) {
    SDL_SetRenderVSync(renderer_, 1);
  } else {
    std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
    return false;
  }

  textures_.init(renderer_);
  input_.init();
  if (uiEnabled_ && !debugUi_.init(window_, renderer_)) {
    std::printf("debug UI unavailable; continuing without overlay\n");
    uiEnabled_ = false;
  }

  return true;
}

void App::run(int maxFrames) {
  uint64_t lastNs = SDL_GetTicksNS();
  int frames = 0;

  while (running_) {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
      handleEvent(e);
    }
    handleCommands(input_.consumeCommands());

    const uint64_t now = SDL_GetTicksNS();
    float dtMs = static_cast<float>(now - lastNs) / 1.0e6F;
    lastNs = now;
    if (dtMs > 0.0F)
      fps_ = fps_ * 0.9F + (1000.0F / dtMs) * 0.1F;

    // Scripted runs use a fixed step so replays are deterministic.
    if (inputScriptEnabled_)
      dtMs = kScriptedDtMs;
    dtMs = std::min(dtMs, kMaxDtMs);

    tick(TimeStep{dtMs, simFrame_});
    render();

    ++frames;
    if (maxFrames > 0 && frames >= maxFrames) {
      running_ = false;
    }
  }
}

void App::shutdown() {
  // Join loader threads before the asset source and collision system go away.
  scenes_.reset();

  debugUi_.shutdown();
  input_.shutdown();
  textures_.shutdown();

  if (gameTarget_) {
    SDL_DestroyTexture(gameTarget_);
    gameTarget_ = nullptr;
  }
  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  SDL_Quit();
}

bool App::playerSnapshot(PlayerSnapshot& out) const {
  if (world_.player == kInvalidEntity || !world_.registry.valid(world_.player))
    return false;
  const auto& t = world_.registry.get<Transform>(world_.player);
  out.valid = true;
  out.x = t.pos.x;
  out.y = t.pos.y;
  out.camX = camera_.x();
  out.camY = camera_.y();
  out.scene = scenes_ ? scenes_->activeName() : std::string{};
  out.character = world_.registry.get<CharacterRoster>(world_.player).current();
  return true;
}

void App::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_QUIT) {
    running_ = false;
    return;
  }

  debugUi_.processEvent(e);
  // Key releases always reach Input so nothing stays stuck while a widget has focus.
  if (e.type == SDL_EVENT_KEY_DOWN && debugUi_.wantCaptureKeyboard())
    return;
  input_.handleEvent(e);
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit)
    running_ = false;
  if (cmds.toggleOverlay)
    debugOverlay_ = !debugOverlay_;
  if (cmds.toggleCollision)
    debugCollision_ = !debugCollision_;
  if (cmds.cycleScene)
    cycleScene();
}

void App::requestScene(const std::string& name) {
  if (scenes_ && scenes_->loadScene(name))
    ++world_.transitionRequests;
}

void App::cycleScene() {
  if (sceneNames_.empty() || !scenes_)
    return;
  const std::string& active = scenes_->activeName();
  auto it = std::find(sceneNames_.begin(), sceneNames_.end(), active);
  const std::size_t next =
      (it == sceneNames_.end()) ? 0 : (static_cast<std::size_t>(it - sceneNames_.begin()) + 1) %
                                          sceneNames_.size();
  requestScene(sceneNames_[next]);
}

void App::tick(TimeStep ts) {
  lastTs_ = ts;
  const ActionState actions =
      inputScriptEnabled_ ? inputScript_.sample(simFrame_) : input_.actions();

  SimContext ctx{collision_, camera_, scenes_.get(),
                 Rect{0.0F, 0.0F, static_cast<float>(viewW_), static_cast<float>(viewH_)}};
  world_.update(ctx, actions, ts);
  ++simFrame_;
}

bool App::ensureGameTarget() {
  if (gameTarget_)
    return true;
  gameTarget_ =
      SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA8888, SDL_TEXTUREACCESS_TARGET, viewW_,
                        viewH_);
  if (!gameTarget_) {
    std::printf("SDL_CreateTexture (game target) failed: %s\n", SDL_GetError());
    return false;
  }
  (void)SDL_SetTextureScaleMode(gameTarget_, SDL_SCALEMODE_NEAREST);
  return true;
}

// Letterboxes the viewport inside the window, preserving its aspect ratio.
SDL_FRect App::gameDestRect(int winW, int winH) const {
  const float scale = std::min(static_cast<float>(winW) / static_cast<float>(viewW_),
                               static_cast<float>(winH) / static_cast<float>(viewH_));
  const float w = static_cast<float>(viewW_) * scale;
  const float h = static_cast<float>(viewH_) * scale;
  return SDL_FRect{(static_cast<float>(winW) - w) * 0.5F, (static_cast<float>(winH) - h) * 0.5F,
                   w, h};
}

void App::render() {
  if (!renderer_ || !ensureGameTarget()) {
    return;
  }

  SDL_SetRenderTarget(renderer_, gameTarget_);
  renderBackground();
  if (debugCollision_)
    renderCollisionDebug();
  renderPlayer();
  renderHud();

  SDL_SetRenderTarget(renderer_, nullptr);
  SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
  SDL_RenderClear(renderer_);

  int winW = 0;
  int winH = 0;
  SDL_GetWindowSize(window_, &winW, &winH);
  const SDL_FRect dst = gameDestRect(winW, winH);
  SDL_RenderTexture(renderer_, gameTarget_, nullptr, &dst);

  if (uiEnabled_) {
    debugUi_.beginFrame();
    if (debugOverlay_)
      renderDebugOverlay();
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}

void App::renderBackground() {
  const Scene* scene = scenes_ ? scenes_->activeScene() : nullptr;
  SDL_Texture* tex = scene ? textures_.get(scene->background) : nullptr;

  if (tex) {
    float texW = 0.0F;
    float texH = 0.0F;
    (void)SDL_GetTextureSize(tex, &texW, &texH);
    SDL_FRect dst{};
    if (scene->meta.hasBounds()) {
      // Scene-sized art scrolls with the camera.
      dst = SDL_FRect{-camera_.x(), -camera_.y(), scene->meta.width, scene->meta.height};
    } else if (texW > 0.0F && texH > 0.0F) {
      // Unknown scene size: cover the viewport, cropping the longer axis.
      const float vw = static_cast<float>(viewW_);
      const float vh = static_cast<float>(viewH_);
      const float scale = std::max(vw / texW, vh / texH);
      dst = SDL_FRect{(vw - texW * scale) * 0.5F, (vh - texH * scale) * 0.5F, texW * scale,
                      texH * scale};
    }
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    SDL_RenderTexture(renderer_, tex, nullptr, &dst);
    return;
  }

  const int bandH = 4;
  for (int y = 0; y < viewH_; y += bandH) {
    const float t = static_cast<float>(y) / static_cast<float>(std::max(1, viewH_ - 1));
    SDL_SetRenderDrawColor(renderer_, lerpChannel(kSkyBlue.r, kPaleGreen.r, t),
                           lerpChannel(kSkyBlue.g, kPaleGreen.g, t),
                           lerpChannel(kSkyBlue.b, kPaleGreen.b, t), 255);
    const SDL_FRect band{0.0F, static_cast<float>(y), static_cast<float>(viewW_),
                         static_cast<float>(bandH)};
    SDL_RenderFillRect(renderer_, &band);
  }
}

void App::renderCollisionDebug() {
  auto outline = [this](const Rect& r) {
    const Vec2 p = camera_.worldToScreen(r.x, r.y);
    const SDL_FRect fr{p.x, p.y, r.w, r.h};
    SDL_RenderRect(renderer_, &fr);
  };

  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(renderer_, 220, 40, 40, 220);
  for (const Collider& c : collision_.colliders())
    outline(c.rect);

  for (const Interactive& it : collision_.interactives()) {
    if (it.isDoor())
      SDL_SetRenderDrawColor(renderer_, 255, 160, 0, 230);
    else
      SDL_SetRenderDrawColor(renderer_, 240, 220, 40, 230);
    outline(it.rect);
  }

  Rect bounds{};
  if (scenes_ && scenes_->activeBounds(bounds)) {
    SDL_SetRenderDrawColor(renderer_, 40, 40, 220, 200);
    outline(bounds);
  }

  SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 200);
  outline(world_.playerRect());
}

void App::renderPlayer() {
  if (world_.player == kInvalidEntity || !world_.registry.valid(world_.player))
    return;

  const Rect r = world_.playerRect();
  const Vec2 p = camera_.worldToScreen(r.x, r.y);
  const Rgb tint = characterTint(world_.registry.get<CharacterRoster>(world_.player).current());

  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(renderer_, tint.r, tint.g, tint.b, 180);
  const SDL_FRect body{p.x, p.y, r.w, r.h};
  SDL_RenderFillRect(renderer_, &body);

  // Facing marker: a triangle pointing the way the player faces.
  const float cx = p.x + r.w * 0.5F;
  const float cy = p.y + r.h * 0.5F;
  const float rad = r.w / 6.0F;
  SDL_FPoint tip{};
  SDL_FPoint a{};
  SDL_FPoint b{};
  switch (world_.registry.get<Facing>(world_.player)) {
    case Facing::Up:
      tip = {cx, cy - rad};
      a = {cx - rad, cy + rad};
      b = {cx + rad, cy + rad};
      break;
    case Facing::Down:
      tip = {cx, cy + rad};
      a = {cx - rad, cy - rad};
      b = {cx + rad, cy - rad};
      break;
    case Facing::Left:
      tip = {cx - rad, cy};
      a = {cx + rad, cy - rad};
      b = {cx + rad, cy + rad};
      break;
    case Facing::Right:
      tip = {cx + rad, cy};
      a = {cx - rad, cy - rad};
      b = {cx - rad, cy + rad};
      break;
  }

  const SDL_FColor black{0.0F, 0.0F, 0.0F, 1.0F};
  const SDL_Vertex verts[3] = {{tip, black, {0.0F, 0.0F}},
                               {a, black, {0.0F, 0.0F}},
                               {b, black, {0.0F, 0.0F}}};
  SDL_RenderGeometry(renderer_, nullptr, verts, 3, nullptr, 0);
}

void App::renderHud() {
  char buf[160];
  SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 200);

  const CharacterRoster* roster = (world_.player != kInvalidEntity)
                                      ? world_.registry.try_get<CharacterRoster>(world_.player)
                                      : nullptr;
  if (roster && !roster->names.empty()) {
    std::snprintf(buf, sizeof(buf), "Character: %s (%zu/%zu)",
                  displayName(roster->current()).c_str(), roster->index + 1,
                  roster->names.size());
    SDL_RenderDebugText(renderer_, 8.0F, 8.0F, buf);
  }

  if (scenes_ && scenes_->hasActiveScene()) {
    const std::string& active = scenes_->activeName();
    auto it = std::find(sceneNames_.begin(), sceneNames_.end(), active);
    const std::size_t idx = (it == sceneNames_.end())
                                ? 0
                                : static_cast<std::size_t>(it - sceneNames_.begin()) + 1;
    std::snprintf(buf, sizeof(buf), "Scene: %s (%zu/%zu)", displayName(active).c_str(), idx,
                  sceneNames_.size());
    SDL_RenderDebugText(renderer_, 8.0F, 20.0F, buf);
  }

  if (scenes_ && scenes_->transitionPending()) {
    std::snprintf(buf, sizeof(buf), "loading %s...", scenes_->pendingName().c_str());
    SDL_RenderDebugText(renderer_, 8.0F, 32.0F, buf);
  }

  SDL_RenderDebugText(renderer_, 8.0F, static_cast<float>(viewH_) - 14.0F,
                      "WASD: Move | E: Interact | Space: Character | B: Scene | F1: Debug");
}

void App::renderDebugOverlay() {
  DebugUIOverlayModel m{};
  m.frame = lastTs_.frame;
  m.dtMs = lastTs_.dtMs;
  m.fps = fps_;
  m.debugCollision = debugCollision_;

  if (scenes_) {
    m.sceneName = scenes_->activeName();
    if (scenes_->transitionPending())
      m.pendingScene = scenes_->pendingName();
    if (const Scene* s = scenes_->activeScene()) {
      m.sceneW = s->meta.width;
      m.sceneH = s->meta.height;
    }
  }
  m.colliderCount = collision_.colliderCount();
  m.interactiveCount = collision_.interactiveCount();

  if (world_.player != kInvalidEntity && world_.registry.valid(world_.player)) {
    const Rect r = world_.playerRect();
    m.hasPlayer = true;
    m.posX = r.x;
    m.posY = r.y;
    m.playerW = r.w;
    m.playerH = r.h;
    m.facing = facingName(world_.registry.get<Facing>(world_.player));
    m.moveState = moveStateName(world_.registry.get<MoveState>(world_.player));
    m.character = world_.registry.get<CharacterRoster>(world_.player).current();
  }

  m.camX = camera_.x();
  m.camY = camera_.y();
  m.camW = camera_.w();
  m.camH = camera_.h();

  float mx = 0.0F;
  float my = 0.0F;
  (void)SDL_GetMouseState(&mx, &my);
  int winW = 0;
  int winH = 0;
  SDL_GetWindowSize(window_, &winW, &winH);
  const SDL_FRect dst = gameDestRect(winW, winH);
  if (dst.w > 0.0F && dst.h > 0.0F && mx >= dst.x && my >= dst.y && mx < dst.x + dst.w &&
      my < dst.y + dst.h) {
    const float sx = (mx - dst.x) * static_cast<float>(viewW_) / dst.w;
    const float sy = (my - dst.y) * static_cast<float>(viewH_) / dst.h;
    const Vec2 world = camera_.screenToWorld(sx, sy);
    m.hasMouse = true;
    m.mouseWorldX = world.x;
    m.mouseWorldY = world.y;
  }

  m.transitionRequests = world_.transitionRequests;
  m.transitionsCompleted = world_.transitionsCompleted;
  m.transitionFailures = world_.transitionFailures;
  m.characterSwitches = world_.characterSwitches;
  m.blockedMoves = world_.blockedMoves;
  m.tomlWarnings = TomlUtil::warningCount();
  m.sceneNames = &sceneNames_;
  input_.appendLegend(m.legend);

  const DebugUIActions actions = debugUi_.drawOverlay(m);
  if (actions.loadScene)
    requestScene(actions.sceneName);
  if (actions.toggleCollision)
    debugCollision_ = !debugCollision_;
}
