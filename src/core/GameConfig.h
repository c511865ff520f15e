#pragma once

#include <optional>
#include <string>
#include <vector>

#include "util/Geometry.h"

// config/game.toml. Every field has a usable default, so a missing file still
// yields a runnable configuration.
struct GameConfig {
  int version = 1;

  struct Window {
    std::string title = "scenewalk";
    int width = 1280;
    int height = 960;
  } window;

  // Camera size and logical render size.
  struct Viewport {
    int width = 640;
    int height = 480;
  } viewport;

  struct Player {
    float width = 96.0F;
    float height = 96.0F;
    float speed = 0.2F;  // px/ms
    float startX = 100.0F;
    float startY = 100.0F;
  } player;

  struct Scenes {
    std::string manifest = "assets/manifest.toml";  // relative to the config file
    std::string start;                              // empty = first scene by name
    std::optional<Vec2> startSpawn;
  } scenes;

  // Overrides the manifest's roster when non-empty.
  std::vector<std::string> characters;

  // Directory the config was loaded from; relative paths resolve against it.
  std::string baseDir;

  bool loadFromToml(const char* path);

  [[nodiscard]] std::string manifestPath() const;
};
