#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// HotkeySystem — Logic phase; runtime tuning of the motion controller.
//
//   L       toggle smoothing
//   [ / ]   smoothing rate -/+ RATE_STEP
// ---------------------------------------------------------------------------

class HotkeySystem {
public:
    static constexpr float RATE_STEP = 0.05f;

    static void Update(ecs::World& world);
};
