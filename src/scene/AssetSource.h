#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "scene/SceneMetadata.h"

enum class SceneError : std::uint8_t {
  None,
  SceneNotFound,     // no manifest entry for the name
  AssetLoadFailure,  // entry exists but its data could not be read or decoded
  TransitionPending,  // another transition has not resolved yet
};

inline const char* sceneErrorName(SceneError e) {
  switch (e) {
    case SceneError::None:
      return "none";
    case SceneError::SceneNotFound:
      return "scene not found";
    case SceneError::AssetLoadFailure:
      return "asset load failure";
    case SceneError::TransitionPending:
      return "transition pending";
  }
  return "unknown";
}

// CPU-side scene data. The background is an opaque handle owned by the asset
// side; the renderer resolves it to a texture.
struct SceneAssets {
  SceneMetadata meta;
  std::string background;  // empty = no background
};

struct SceneFetch {
  SceneError error = SceneError::None;
  std::string message;
  std::shared_ptr<const SceneAssets> assets;

  [[nodiscard]] bool ok() const { return error == SceneError::None && assets != nullptr; }
};

class AssetSource {
 public:
  virtual ~AssetSource() = default;

  // Runs on a loader thread, possibly several at once for different names.
  virtual SceneFetch fetchScene(const std::string& name) = 0;
};
