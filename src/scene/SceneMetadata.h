#pragma once

#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.h>

#include "util/Geometry.h"

struct Collider {
  Rect rect{};
};

struct Interactive {
  Rect rect{};
  std::string type;
  std::string destinationScene;  // empty = none
  std::optional<Vec2> spawnPoint;

  [[nodiscard]] bool isDoor() const { return type == "door"; }
};

// Canonical shape every manifest variant is normalized into.
struct SceneMetadata {
  float width = 0.0F;
  float height = 0.0F;
  std::vector<Collider> colliders;
  std::vector<Interactive> interactives;

  [[nodiscard]] bool hasBounds() const { return width > 0.0F && height > 0.0F; }
  [[nodiscard]] Rect bounds() const { return Rect{0.0F, 0.0F, width, height}; }
};

// Reads one scene table. Field aliases (w/width, h/height, rect/area/zone, ...) are
// accepted. Entries with missing size fields are kept as zero-size rectangles and
// reported through TomlUtil::warnf; the load itself never fails on them.
void parseSceneMetadata(const toml::table& tbl, const char* sourcePath, SceneMetadata& out);

// Keys parseSceneMetadata understands at scene-table level.
bool isSceneMetadataKey(const std::string& key);
