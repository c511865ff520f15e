#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <toml++/toml.h>

#include "scene/AssetSource.h"

// Asset source backed by a TOML manifest. Each [scenes.<name>] entry either
// points at a metadata file (meta = "...") or carries the metadata inline; a plain
// string entry names a background only. Paths are relative to the manifest.
//
// load() must finish before any fetchScene() call; fetchScene() itself is safe to
// call from several loader threads.
class ManifestAssets : public AssetSource {
 public:
  bool load(const char* manifestPath);

  SceneFetch fetchScene(const std::string& name) override;

  [[nodiscard]] bool hasScene(const std::string& name) const;
  [[nodiscard]] std::vector<std::string> sceneNames() const;
  [[nodiscard]] const std::vector<std::string>& characters() const { return characters_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] int fetchCount() const;

 private:
  struct Entry {
    std::string background;
    std::string metaPath;
    bool hasInlineMeta = false;
    toml::table inlineMeta;
  };

  SceneFetch readEntry(const std::string& name, const Entry& entry) const;

  std::unordered_map<std::string, Entry> entries_;
  std::vector<std::string> characters_;
  std::filesystem::path baseDir_;
  std::string path_;

  mutable std::mutex cacheMutex_;
  std::unordered_map<std::string, std::shared_ptr<const SceneAssets>> cache_;
  int fetchCount_ = 0;
};
