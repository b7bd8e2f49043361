#pragma once
#include <ecs/ecs.hpp>

// Runs the session's PaddleMotionController for this frame and reports
// device switches and settles on the event bus for PaddleTelemetrySystem.
// Runs in the Logic phase, after HotkeySystem.
class PaddleControlSystem {
public:
    static void Update(ecs::World& world, float dt);
};
