#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Adds RenderSystem to the Render phase. finish() adds EndFrameSystem and
// must be called after every other module that draws (e.g. DebugModule).
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void finish(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { EndFrameSystem::Update(w); });
    }
};
