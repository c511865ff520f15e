#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

struct CliOptions {
  AppConfig app{};
  const char* videoDriver = nullptr;
  int maxFrames = -1;
};

constexpr const char* kUsageBody =
    "  --config PATH        Game config (default: config/game.toml)\n"
    "  --manifest PATH      Scene manifest (overrides [scenes].manifest)\n"
    "  --scene NAME         Start scene (overrides [scenes].start)\n"
    "  --frames N           Step N frames, print the final player state, exit\n"
    "  --input-script PATH  Replay a TOML keyframe script instead of live input\n"
    "  --video-driver NAME  SDL video backend hint (x11, wayland, offscreen, ...)\n"
    "  --width W            Window width override\n"
    "  --height H           Window height override\n"
    "  --no-ui              Start without the ImGui overlay\n"
    "  -h, --help           Print this text\n";

void usage(const char* argv0) {
  std::printf("usage: %s [options]\n%s", argv0, kUsageBody);
}

// Positive integers only; frame counts and window sizes share the same range.
bool toPositiveInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (*end != '\0' || v < 1 || v > 100000)
    return false;
  out = static_cast<int>(v);
  return true;
}

struct AppIntOption {
  std::string_view flag;
  int AppConfig::*outPtr;
};

struct AppStringOption {
  std::string_view flag;
  const char* AppConfig::*outPtr;
};

constexpr std::array<AppStringOption, 4> kAppStringOptions{{
    {"--config", &AppConfig::configPath},
    {"--manifest", &AppConfig::manifestPath},
    {"--scene", &AppConfig::sceneName},
    {"--input-script", &AppConfig::inputScriptTomlPath},
}};

constexpr std::array<AppIntOption, 2> kAppIntOptions{{
    {"--width", &AppConfig::width},
    {"--height", &AppConfig::height},
}};

enum class ParseOutcome { Run, ExitOk, ExitError };

ParseOutcome parseArgs(int argc, char** argv, CliOptions& opts) {
  auto fail = [&](const char* fmt, const char* what) {
    std::printf(fmt, what);
    usage(argv[0]);
    return ParseOutcome::ExitError;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

    if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return ParseOutcome::ExitOk;
    }
    if (arg == "--no-ui") {
      opts.app.noUi = true;
      continue;
    }
    if (arg == "--video-driver") {
      if (!next)
        return fail("missing %s value\n", argv[i]);
      opts.videoDriver = next;
      ++i;
      continue;
    }
    if (arg == "--frames") {
      if (!toPositiveInt(next, opts.maxFrames))
        return fail("invalid %s value\n", argv[i]);
      ++i;
      continue;
    }

    bool matched = false;
    for (const AppStringOption& o : kAppStringOptions) {
      if (arg != o.flag)
        continue;
      if (!next)
        return fail("missing %s value\n", argv[i]);
      opts.app.*o.outPtr = next;
      matched = true;
      break;
    }
    for (const AppIntOption& o : kAppIntOptions) {
      if (matched || arg != o.flag)
        continue;
      if (!toPositiveInt(next, opts.app.*o.outPtr))
        return fail("invalid %s value\n", argv[i]);
      matched = true;
      break;
    }
    if (!matched)
      return fail("unknown option: %s\n", argv[i]);
    ++i;
  }
  return ParseOutcome::Run;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts{};
  opts.app.argv0 = argv[0];

  switch (parseArgs(argc, argv, opts)) {
    case ParseOutcome::ExitOk:
      return 0;
    case ParseOutcome::ExitError:
      return 1;
    case ParseOutcome::Run:
      break;
  }

  if (opts.videoDriver)
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, opts.videoDriver);

  App app;
  if (!app.init(opts.app)) {
    app.shutdown();
    return 1;
  }

  app.run(opts.maxFrames);

  // Headless runs report where the player ended up so scripted walks can be checked.
  App::PlayerSnapshot snap{};
  if (opts.maxFrames > 0 && app.playerSnapshot(snap)) {
    std::printf("final: scene=%s character=%s pos=(%.1f, %.1f) camera=(%.0f, %.0f)\n",
                snap.scene.c_str(), snap.character.c_str(), snap.x, snap.y, snap.camX, snap.camY);
  }

  app.shutdown();
  return 0;
}
