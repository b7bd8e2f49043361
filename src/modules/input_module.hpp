#pragma once
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds InputGatherSystem to the Pre-Update phase, after the event flush.
// It writes into the PaddleSession's InputArbiter, so PaddleModule must be
// installed before the first frame runs (install order is free).
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
    }
};
