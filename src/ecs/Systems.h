#pragma once

class World;
struct SimContext;
struct TimeStep;

namespace Systems {
void sceneTransitions(World& w, SimContext& ctx);
void movement(World& w, SimContext& ctx, TimeStep ts);
void clampToBounds(World& w, SimContext& ctx);
void followCamera(World& w, SimContext& ctx);
void interact(World& w, SimContext& ctx);
void switchCharacter(World& w);
}  // namespace Systems
