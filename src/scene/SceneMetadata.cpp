#include "scene/SceneMetadata.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "util/TomlUtil.h"

static constexpr std::array<std::string_view, 8> kSceneKeys = {
    "width", "w", "height", "h", "collision", "colliders", "interactive", "interactives"};

bool isSceneMetadataKey(const std::string& key) {
  for (std::string_view k : kSceneKeys) {
    if (key == k)
      return true;
  }
  return false;
}

static std::optional<Vec2> readPoint(const toml::node& node) {
  if (auto t = node.as_table()) {
    auto x = TomlUtil::numberAny(*t, {"x"});
    auto y = TomlUtil::numberAny(*t, {"y"});
    if (!x || !y)
      return std::nullopt;
    return Vec2{*x, *y};
  }
  if (auto a = node.as_array()) {
    if (a->size() != 2)
      return std::nullopt;
    auto x = (*a)[0].value<double>();
    auto y = (*a)[1].value<double>();
    if (!x || !y)
      return std::nullopt;
    return Vec2{static_cast<float>(*x), static_cast<float>(*y)};
  }
  return std::nullopt;
}

// Missing position fields default to 0; missing size fields make the whole rect
// degenerate so it can never block or trigger.
static bool readRect(const toml::table& t, Rect& r) {
  r.x = TomlUtil::numberAny(t, {"x"}).value_or(0.0F);
  r.y = TomlUtil::numberAny(t, {"y"}).value_or(0.0F);
  auto w = TomlUtil::numberAny(t, {"w", "width"});
  auto h = TomlUtil::numberAny(t, {"h", "height"});
  if (!w || !h) {
    r.w = 0.0F;
    r.h = 0.0F;
    return false;
  }
  r.w = *w;
  r.h = *h;
  return true;
}

void parseSceneMetadata(const toml::table& tbl, const char* sourcePath, SceneMetadata& out) {
  SceneMetadata next;

  next.width = TomlUtil::numberAny(tbl, {"width", "w"}).value_or(0.0F);
  next.height = TomlUtil::numberAny(tbl, {"height", "h"}).value_or(0.0F);
  if (next.width < 0.0F || next.height < 0.0F) {
    TomlUtil::warnf(sourcePath, "scene size must be >= 0 (got {:.1F}x{:.1F}); treating as unknown",
                    next.width, next.height);
    next.width = 0.0F;
    next.height = 0.0F;
  }

  if (const toml::node* n = TomlUtil::findAny(tbl, {"collision", "colliders"})) {
    if (auto arr = n->as_array()) {
      std::size_t idx = 0;
      for (const auto& node : *arr) {
        const std::string scope = "collision[" + std::to_string(idx++) + "]";
        auto t = node.as_table();
        if (!t) {
          TomlUtil::warnf(sourcePath, "{} is not a table; substituting empty rect", scope);
          next.colliders.push_back(Collider{});
          continue;
        }
        TomlUtil::warnUnknownKeys(*t, sourcePath, scope, {"x", "y", "w", "h", "width", "height"});

        Collider c{};
        if (!readRect(*t, c.rect)) {
          TomlUtil::warnf(sourcePath, "{} is missing w/h; substituting empty rect", scope);
        } else if (c.rect.empty()) {
          TomlUtil::warnf(sourcePath, "{} has invalid size (w={:.3F} h={:.3F})", scope, c.rect.w,
                          c.rect.h);
        }
        next.colliders.push_back(c);
      }
    } else {
      TomlUtil::warnf(sourcePath, "collision must be an array of tables");
    }
  }

  if (const toml::node* n = TomlUtil::findAny(tbl, {"interactive", "interactives"})) {
    if (auto arr = n->as_array()) {
      std::size_t idx = 0;
      for (const auto& node : *arr) {
        const std::string scope = "interactive[" + std::to_string(idx++) + "]";
        auto t = node.as_table();
        if (!t) {
          TomlUtil::warnf(sourcePath, "{} is not a table; substituting empty rect", scope);
          next.interactives.push_back(Interactive{});
          continue;
        }
        TomlUtil::warnUnknownKeys(
            *t, sourcePath, scope,
            {"x", "y", "w", "h", "width", "height", "rect", "area", "zone", "type",
             "destinationScene", "destination_scene", "destination", "spawnPoint", "spawn_point",
             "spawn"});

        Interactive it{};
        const toml::table* rectTable = t;
        if (const toml::node* nested = TomlUtil::findAny(*t, {"rect", "area", "zone"})) {
          rectTable = nested->as_table();
          if (!rectTable) {
            TomlUtil::warnf(sourcePath, "{} rect must be a table", scope);
          }
        }
        if (!rectTable || !readRect(*rectTable, it.rect)) {
          it.rect = Rect{};
          TomlUtil::warnf(sourcePath, "{} is missing w/h; substituting empty rect", scope);
        }

        if (auto v = t->get("type"))
          it.type = v->value_or(std::string{});
        if (auto v = TomlUtil::findAny(*t, {"destinationScene", "destination_scene", "destination"}))
          it.destinationScene = v->value_or(std::string{});
        if (auto v = TomlUtil::findAny(*t, {"spawnPoint", "spawn_point", "spawn"})) {
          it.spawnPoint = readPoint(*v);
          if (!it.spawnPoint) {
            TomlUtil::warnf(sourcePath, "{} spawn point must be {{x, y}} or [x, y]; ignoring",
                            scope);
          }
        }

        if (it.isDoor() && it.destinationScene.empty()) {
          TomlUtil::warnf(sourcePath, "{} is a door without destination_scene; it will not trigger",
                          scope);
        }
        next.interactives.push_back(std::move(it));
      }
    } else {
      TomlUtil::warnf(sourcePath, "interactive must be an array of tables");
    }
  }

  out = std::move(next);
}
