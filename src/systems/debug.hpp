#pragma once
#include <ecs/ecs.hpp>

// Render phase, after RenderSystem and before EndFrameSystem.
// F3 toggles DebugPanel::visible; when visible, draws every registered row
// and field strip in a panel pinned to the top-left corner.
class DebugSystem {
public:
    static void Update(ecs::World& world);
};
