#include "paddle_telemetry.hpp"
#include "../events.hpp"
#include "../paddle_telemetry.hpp"
#include <raylib.h>

using namespace ecs;

void PaddleTelemetrySystem::Update(World& world) {
    auto* telemetry = world.try_resource<PaddleTelemetry>();
    auto* switches  = world.try_resource<Events<DeviceChangedEvent>>();
    auto* settled   = world.try_resource<Events<PaddleSettledEvent>>();
    if (!telemetry || !switches || !settled) return;

    for (const auto& e : switches->read()) {
        TraceLog(LOG_INFO, "INPUT: Active device %s -> %s",
                 device_name(e.from), device_name(e.to));
    }
    for (const auto& e : settled->read()) {
        TraceLog(LOG_DEBUG, "PADDLE: Settled at %.1f", e.x);
    }

    telemetry->consume(*switches, *settled);
}
