#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../settings.hpp"
#include <ecs/ecs.hpp>
#include <utility>

// ---------------------------------------------------------------------------
// CoreModule
//
// Publishes the GameSettings world resource, creates the EventRegistry and
// installs the per-frame event flush as the first Pre-Update step. Must be
// the first module installed so later modules can read settings and call
// register_queue<T>() on a live registry.
// ---------------------------------------------------------------------------

struct CoreModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, GameSettings settings) {
        world.set_resource(std::move(settings));
        world.set_resource(EventRegistry{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
