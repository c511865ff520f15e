#include "core/DebugUI.h"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <algorithm>
#include <cstdio>

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  io.IniFilename = nullptr;  // layout is not persisted
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
}

void DebugUI::shutdown() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
}

void DebugUI::processEvent(const SDL_Event& e) {
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
}

void DebugUI::beginFrame() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}

bool DebugUI::wantCaptureKeyboard() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
}

// NOLINTNEXTLINE
DebugUIActions DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
  DebugUIActions actions{};
  if (!initialized_)
    return actions;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 64.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.80F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Debug", nullptr, flags)) {
    ImGui::Text("fps: %.1F  frame: %llu  dt: %.2F ms", model.fps,
                static_cast<unsigned long long>(model.frame), model.dtMs);

    ImGui::Separator();
    ImGui::TextUnformatted("Scene");
    ImGui::Text("active: %s", model.sceneName.empty() ? "(none)" : model.sceneName.c_str());
    if (model.sceneW > 0.0F && model.sceneH > 0.0F)
      ImGui::Text("size: %.0F x %.0F", model.sceneW, model.sceneH);
    else
      ImGui::TextUnformatted("size: unknown (fallback bounds)");
    ImGui::Text("colliders: %zu  interactives: %zu", model.colliderCount, model.interactiveCount);
    if (!model.pendingScene.empty())
      ImGui::Text("loading: %s", model.pendingScene.c_str());

    if (model.sceneNames && !model.sceneNames->empty()) {
      const auto& names = *model.sceneNames;
      selectedScene_ = std::clamp(selectedScene_, 0, static_cast<int>(names.size()) - 1);
      if (ImGui::BeginCombo("##scene", names[static_cast<std::size_t>(selectedScene_)].c_str())) {
        for (int i = 0; i < static_cast<int>(names.size()); ++i) {
          const bool selected = (i == selectedScene_);
          if (ImGui::Selectable(names[static_cast<std::size_t>(i)].c_str(), selected))
            selectedScene_ = i;
          if (selected)
            ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
      }
      ImGui::SameLine();
      if (ImGui::Button("Load")) {
        actions.loadScene = true;
        actions.sceneName = names[static_cast<std::size_t>(selectedScene_)];
      }
    }

    bool collision = model.debugCollision;
    if (ImGui::Checkbox("collision (F2)", &collision))
      actions.toggleCollision = true;

    ImGui::Separator();
    ImGui::TextUnformatted("Player");
    if (model.hasPlayer) {
      ImGui::Text("pos: (%.1F, %.1F)  size: %.0F x %.0F", model.posX, model.posY, model.playerW,
                  model.playerH);
      ImGui::Text("facing: %s  state: %s", model.facing, model.moveState);
      ImGui::Text("character: %s", model.character.empty() ? "-" : model.character.c_str());
    } else {
      ImGui::TextUnformatted("(no player)");
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Camera");
    ImGui::Text("offset: (%.0F, %.0F)  view: %.0F x %.0F", model.camX, model.camY, model.camW,
                model.camH);
    if (model.hasMouse)
      ImGui::Text("mouse world: (%.1F, %.1F)", model.mouseWorldX, model.mouseWorldY);

    ImGui::Separator();
    ImGui::TextUnformatted("Counters");
    ImGui::Text("transitions: %d requested  %d done  %d failed", model.transitionRequests,
                model.transitionsCompleted, model.transitionFailures);
    ImGui::Text("switches: %d  blocked moves: %d", model.characterSwitches, model.blockedMoves);
    ImGui::Text("toml warnings: %d", model.tomlWarnings);

    if (!model.legend.empty() && ImGui::CollapsingHeader("Controls")) {
      for (const std::string& line : model.legend)
        ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::End();
  return actions;
}
