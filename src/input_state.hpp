#pragma once
#include <optional>
#include <variant>

// ---------------------------------------------------------------------------
// InputSnapshot — per-frame, immutable view of the governing input device.
//
// Exactly one device is active at a time; the variant makes two simultaneously
// active devices unrepresentable. NoDevice means nothing is engaged and every
// consumer must treat it as a no-op frame.
// ---------------------------------------------------------------------------

enum class InputDevice { None, Keyboard, Mouse, Touch };

struct NoDevice {};

struct KeyboardInput {
    bool left  = false;
    bool right = false;
};

// x is absent when the device is engaged but produced no coordinate this frame.
struct PointerInput {
    std::optional<float> x;
};

struct TouchInput {
    std::optional<float> x;
};

using InputSnapshot = std::variant<NoDevice, KeyboardInput, PointerInput, TouchInput>;

inline const char* device_name(InputDevice d) {
    switch (d) {
        case InputDevice::Keyboard: return "Keyboard";
        case InputDevice::Mouse:    return "Mouse";
        case InputDevice::Touch:    return "Touch";
        default:                    return "None";
    }
}

// Query interface the motion controller reads once per tick.
class InputSource {
public:
    virtual ~InputSource() = default;

    // Latest snapshot. Never blocks, never queues.
    virtual InputSnapshot snapshot() const = 0;
};
