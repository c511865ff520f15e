#include "core/TextureCache.h"

#include <cctype>
#include <cstdio>
#include <memory>
#include <string>

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_stdinc.h>
#include <SDL3/SDL_surface.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace {

std::string lowerExtension(const std::string& path) {
  const std::size_t dot = path.find_last_of('.');
  if (dot == std::string::npos)
    return {};
  std::string ext = path.substr(dot);
  for (char& c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

// stb_image covers the formats scene art ships in (png, jpg, tga, ...); BMP goes
// through SDL directly.
SDL_Surface* loadWithStb(const char* path) {
  int width = 0;
  int height = 0;
  int channels = 0;

  using Pixels = std::unique_ptr<unsigned char, decltype(&stbi_image_free)>;
  Pixels data(stbi_load(path, &width, &height, &channels, 4), stbi_image_free);
  if (!data) {
    std::printf("stbi_load failed: %s (%s)\n", path, stbi_failure_reason());
    return nullptr;
  }

  SDL_Surface* view =
      SDL_CreateSurfaceFrom(width, height, SDL_PIXELFORMAT_RGBA32, data.get(), width * 4);
  if (!view) {
    std::printf("SDL_CreateSurfaceFrom failed: %s (%s)\n", path, SDL_GetError());
    return nullptr;
  }

  // The surface only borrows `data`; copy before it is freed.
  SDL_Surface* copied = SDL_DuplicateSurface(view);
  SDL_DestroySurface(view);
  return copied;
}

}  // namespace

void TextureCache::init(SDL_Renderer* renderer) {
  renderer_ = renderer;
}

void TextureCache::shutdown() {
  for (auto& [path, tex] : textures_) {
    (void)path;
    if (tex)
      SDL_DestroyTexture(tex);
  }
  textures_.clear();
  failed_.clear();
  renderer_ = nullptr;
}

SDL_Texture* TextureCache::get(const std::string& path) {
  if (path.empty())
    return nullptr;

  auto it = textures_.find(path);
  if (it != textures_.end())
    return it->second;
  if (failed_.contains(path))
    return nullptr;

  SDL_Texture* tex = loadTexture(path);
  if (!tex) {
    failed_.insert(path);
    return nullptr;
  }

  textures_.emplace(path, tex);
  return tex;
}

SDL_Texture* TextureCache::loadTexture(const std::string& path) {
  if (!renderer_)
    return nullptr;

  SDL_Surface* surface = nullptr;
  if (lowerExtension(path) == ".bmp") {
    surface = SDL_LoadBMP(path.c_str());
    if (!surface)
      std::printf("SDL_LoadBMP failed: %s (%s)\n", path.c_str(), SDL_GetError());
  } else {
    surface = loadWithStb(path.c_str());
  }
  if (!surface)
    return nullptr;

  SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surface);
  SDL_DestroySurface(surface);

  if (!tex) {
    std::printf("SDL_CreateTextureFromSurface failed: %s (%s)\n", path.c_str(), SDL_GetError());
    return nullptr;
  }

  (void)SDL_SetTextureScaleMode(tex, SDL_SCALEMODE_NEAREST);
  (void)SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  return tex;
}
