#pragma once
#include "events.hpp"
#include "input_state.hpp"
#include <optional>

// ---------------------------------------------------------------------------
// PaddleTelemetry — running totals folded from this frame's event queues.
//
// Stored as a World resource. PaddleTelemetrySystem calls consume() once per
// frame in the Logic phase, after PaddleControlSystem has sent; the debug
// panel reads the totals. No raylib dependency.
// ---------------------------------------------------------------------------

struct PaddleTelemetry {
    int                  device_switches = 0;
    InputDevice          switched_from   = InputDevice::None;
    InputDevice          switched_to     = InputDevice::None;
    int                  settles         = 0;
    std::optional<float> last_settle_x;

    void consume(const Events<DeviceChangedEvent>& switches,
                 const Events<PaddleSettledEvent>& settled) {
        for (const auto& e : switches.read()) {
            ++device_switches;
            switched_from = e.from;
            switched_to   = e.to;
        }
        for (const auto& e : settled.read()) {
            ++settles;
            last_settle_x = e.x;
        }
    }
};
