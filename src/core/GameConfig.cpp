#include "core/GameConfig.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

void readPositiveInt(const toml::table& t,
                     const char* path,
                     const char* scope,
                     const char* key,
                     int minValue,
                     int& out) {
  const toml::node* n = t.get(key);
  if (!n)
    return;
  auto v = n->value<int64_t>();
  if (!v) {
    TomlUtil::warnf(path, "{}.{} must be an integer; using default", scope, key);
    return;
  }
  if (*v < minValue) {
    TomlUtil::warnf(path, "{}.{} must be >= {} (got {}); clamping", scope, key, minValue, *v);
    out = minValue;
    return;
  }
  out = static_cast<int>(std::min<int64_t>(*v, 16384));
}

void readPositiveFloat(const toml::table& t,
                       const char* path,
                       const char* scope,
                       const char* key,
                       float& out) {
  auto v = TomlUtil::numberAny(t, {key});
  if (!v) {
    if (t.contains(key))
      TomlUtil::warnf(path, "{}.{} must be a number; using default", scope, key);
    return;
  }
  if (*v <= 0.0F) {
    TomlUtil::warnf(path, "{}.{} must be > 0 (got {:.2f}); using default", scope, key, *v);
    return;
  }
  out = *v;
}

}  // namespace

bool GameConfig::loadFromToml(const char* path) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(path, "failed to parse config: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "window", "viewport", "player", "scenes", "characters"});

  GameConfig next = *this;
  next.baseDir = std::filesystem::path(path).parent_path().string();

  if (auto v = tbl["version"].value<int>())
    next.version = *v;
  if (next.version != 1) {
    TomlUtil::warnf(path, "config version {} (expected 1)", next.version);
  }

  if (auto w = tbl["window"].as_table()) {
    TomlUtil::warnUnknownKeys(*w, path, "window", {"title", "width", "height"});
    if (auto v = w->get("title"))
      next.window.title = v->value_or(next.window.title);
    readPositiveInt(*w, path, "window", "width", 64, next.window.width);
    readPositiveInt(*w, path, "window", "height", 64, next.window.height);
  }

  if (auto v = tbl["viewport"].as_table()) {
    TomlUtil::warnUnknownKeys(*v, path, "viewport", {"width", "height"});
    readPositiveInt(*v, path, "viewport", "width", 1, next.viewport.width);
    readPositiveInt(*v, path, "viewport", "height", 1, next.viewport.height);
  }

  if (auto p = tbl["player"].as_table()) {
    TomlUtil::warnUnknownKeys(*p, path, "player",
                              {"width", "height", "speed", "start_x", "start_y"});
    readPositiveFloat(*p, path, "player", "width", next.player.width);
    readPositiveFloat(*p, path, "player", "height", next.player.height);
    readPositiveFloat(*p, path, "player", "speed", next.player.speed);
    next.player.startX = TomlUtil::numberAny(*p, {"start_x"}).value_or(next.player.startX);
    next.player.startY = TomlUtil::numberAny(*p, {"start_y"}).value_or(next.player.startY);
  }

  if (auto s = tbl["scenes"].as_table()) {
    TomlUtil::warnUnknownKeys(*s, path, "scenes", {"manifest", "start", "start_spawn"});
    if (auto v = s->get("manifest"))
      next.scenes.manifest = v->value_or(next.scenes.manifest);
    if (auto v = s->get("start"))
      next.scenes.start = v->value_or(next.scenes.start);
    if (auto sp = s->get("start_spawn")) {
      auto t = sp->as_table();
      auto x = t ? TomlUtil::numberAny(*t, {"x"}) : std::nullopt;
      auto y = t ? TomlUtil::numberAny(*t, {"y"}) : std::nullopt;
      if (x && y) {
        next.scenes.startSpawn = Vec2{*x, *y};
      } else {
        TomlUtil::warnf(path, "scenes.start_spawn must be {{x = .., y = ..}}; ignoring");
      }
    }
  }

  if (auto chars = tbl["characters"].as_array()) {
    next.characters.clear();
    for (const auto& node : *chars) {
      auto s = node.value<std::string>();
      if (!s || s->empty()) {
        TomlUtil::warnf(path, "characters entries must be non-empty strings");
        continue;
      }
      next.characters.push_back(*s);
    }
  } else if (tbl.contains("characters")) {
    TomlUtil::warnf(path, "characters must be an array of strings");
  }

  *this = std::move(next);
  return true;
}

std::string GameConfig::manifestPath() const {
  const std::filesystem::path p(scenes.manifest);
  if (p.is_absolute() || baseDir.empty())
    return p.lexically_normal().string();
  return (std::filesystem::path(baseDir) / p).lexically_normal().string();
}
