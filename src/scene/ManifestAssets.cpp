#include "scene/ManifestAssets.h"

#include <algorithm>
#include <string_view>
#include <system_error>
#include <utility>

#include "util/TomlUtil.h"

static bool fileExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec) && !ec;
}

bool ManifestAssets::load(const char* manifestPath) {
  if (manifestPath == nullptr || *manifestPath == '\0')
    return false;

  toml::table tbl;
  try {
    tbl = toml::parse_file(manifestPath);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(manifestPath, "failed to parse manifest: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, manifestPath, "root", {"version", "characters", "scenes"});

  std::unordered_map<std::string, Entry> nextEntries;
  std::vector<std::string> nextCharacters;

  if (auto chars = tbl["characters"].as_array()) {
    for (const auto& node : *chars) {
      auto s = node.value<std::string>();
      if (!s || s->empty()) {
        TomlUtil::warnf(manifestPath, "characters entries must be non-empty strings");
        continue;
      }
      nextCharacters.push_back(*s);
    }
  }

  if (auto scenes = tbl["scenes"].as_table()) {
    for (const auto& [key, node] : *scenes) {
      const std::string name(key.str());
      const std::string scope = "scenes." + name;
      Entry entry{};

      if (auto s = node.value<std::string>()) {
        entry.background = *s;
        nextEntries.emplace(name, std::move(entry));
        continue;
      }

      auto t = node.as_table();
      if (!t) {
        TomlUtil::warnf(manifestPath, "{} must be a table or a background path string", scope);
        continue;
      }

      for (const auto& [k, v] : *t) {
        (void)v;
        const std::string ks(k.str());
        if (isSceneMetadataKey(ks)) {
          entry.hasInlineMeta = true;
          continue;
        }
        if (TomlUtil::allowedKey(ks, {"background", "path", "meta", "metaPath", "meta_path"})) {
          continue;
        }
        TomlUtil::warnf(manifestPath, "unknown key '{}' in {}", ks, scope);
      }

      if (auto v = TomlUtil::findAny(*t, {"background", "path"}))
        entry.background = v->value_or(std::string{});
      if (auto v = TomlUtil::findAny(*t, {"meta", "metaPath", "meta_path"}))
        entry.metaPath = v->value_or(std::string{});

      if (entry.hasInlineMeta) {
        entry.inlineMeta = *t;
        if (!entry.metaPath.empty()) {
          TomlUtil::warnf(manifestPath, "{} has both inline metadata and meta file; using inline",
                          scope);
          entry.metaPath.clear();
        }
      }

      nextEntries.emplace(name, std::move(entry));
    }
  } else {
    TomlUtil::warnf(manifestPath, "manifest has no [scenes] table");
  }

  entries_ = std::move(nextEntries);
  characters_ = std::move(nextCharacters);
  path_ = manifestPath;
  baseDir_ = std::filesystem::path(manifestPath).parent_path();
  {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    cache_.clear();
    fetchCount_ = 0;
  }
  return true;
}

bool ManifestAssets::hasScene(const std::string& name) const {
  return entries_.find(name) != entries_.end();
}

std::vector<std::string> ManifestAssets::sceneNames() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    (void)entry;
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

int ManifestAssets::fetchCount() const {
  std::lock_guard<std::mutex> lock(cacheMutex_);
  return fetchCount_;
}

SceneFetch ManifestAssets::fetchScene(const std::string& name) {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    SceneFetch out{};
    out.error = SceneError::SceneNotFound;
    out.message = "no manifest entry for scene '" + name + "'";
    return out;
  }

  {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    if (auto cached = cache_.find(name); cached != cache_.end()) {
      SceneFetch out{};
      out.assets = cached->second;
      return out;
    }
  }

  SceneFetch out = readEntry(name, it->second);
  if (!out.ok())
    return out;

  std::lock_guard<std::mutex> lock(cacheMutex_);
  ++fetchCount_;
  auto [slot, inserted] = cache_.emplace(name, out.assets);
  if (!inserted)
    out.assets = slot->second;
  return out;
}

SceneFetch ManifestAssets::readEntry(const std::string& name, const Entry& entry) const {
  SceneFetch out{};
  auto assets = std::make_shared<SceneAssets>();

  if (entry.hasInlineMeta) {
    const std::string scope = path_ + " [scenes." + name + "]";
    parseSceneMetadata(entry.inlineMeta, scope.c_str(), assets->meta);
  } else if (!entry.metaPath.empty()) {
    const std::filesystem::path metaPath = baseDir_ / entry.metaPath;
    const std::string metaStr = metaPath.lexically_normal().string();
    if (!fileExists(metaPath)) {
      out.error = SceneError::AssetLoadFailure;
      out.message = "metadata file not found: " + metaStr;
      return out;
    }

    toml::table metaTable;
    try {
      metaTable = toml::parse_file(metaStr);
    } catch (const toml::parse_error& err) {
      out.error = SceneError::AssetLoadFailure;
      out.message = "failed to parse " + metaStr + ": " + std::string(err.description());
      return out;
    }
    TomlUtil::warnUnknownKeys(metaTable, metaStr.c_str(), "root",
                              {"version", "width", "w", "height", "h", "collision", "colliders",
                               "interactive", "interactives"});
    parseSceneMetadata(metaTable, metaStr.c_str(), assets->meta);
  }

  if (!entry.background.empty()) {
    const std::filesystem::path bgPath = baseDir_ / entry.background;
    if (fileExists(bgPath)) {
      assets->background = bgPath.lexically_normal().string();
    } else {
      TomlUtil::warnf(path_.c_str(), "background for scene '{}' not found: {}", name,
                      bgPath.lexically_normal().string());
    }
  }

  out.assets = std::move(assets);
  return out;
}
