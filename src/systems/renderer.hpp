#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render phase; opens the frame, clears it and draws the
// paddle from its PaddleState. DebugSystem draws on top and EndFrameSystem
// closes the frame, so RenderSystem must be the first render step.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
};

class EndFrameSystem {
public:
    static void Update(ecs::World& world);
};
