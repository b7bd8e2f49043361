#pragma once
#include <ecs/ecs.hpp>

// Drains this frame's DeviceChangedEvent and PaddleSettledEvent queues into
// the PaddleTelemetry resource and logs them.
// Runs in the Logic phase, after PaddleControlSystem.
class PaddleTelemetrySystem {
public:
    static void Update(ecs::World& world);
};
