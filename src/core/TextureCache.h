#pragma once

#include <SDL3/SDL_render.h>

#include <string>
#include <unordered_map>
#include <unordered_set>

// Scene background textures keyed by the asset handle (a resolved file path).
// A path that failed to load is remembered and not retried, since the renderer
// asks for the active background every frame.
class TextureCache {
 public:
  void init(SDL_Renderer* renderer);
  void shutdown();

  SDL_Texture* get(const std::string& path);

  [[nodiscard]] std::size_t size() const { return textures_.size(); }

 private:
  SDL_Texture* loadTexture(const std::string& path);

  SDL_Renderer* renderer_ = nullptr;
  std::unordered_map<std::string, SDL_Texture*> textures_;
  std::unordered_set<std::string> failed_;
};
