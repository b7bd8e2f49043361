#pragma once
#include <ecs/ecs.hpp>
#include <optional>
#include <variant>

// components.hpp carries no raylib dependency so the headless test target can
// include it. Colour conversion happens in the renderer.

// ---------------------------------------------------------------------------
// Colour
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 Paddle = {0.25f, 0.75f, 0.95f, 1.0f};
}

// ---------------------------------------------------------------------------
// Paddle (entity data)
// ---------------------------------------------------------------------------

struct PaddleConfig {
    float width  = 100.0f;
    float height = 20.0f;
    float speed  = 480.0f;  // units per second (8 units per 1/60 s tick)
    float max_x  = 800.0f;  // right edge of the play field
};

// Partial update: only engaged fields are merged.
struct PaddleConfigPatch {
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> speed;
    std::optional<float> max_x;
};

// Value snapshot handed to external consumers (renderer, debug overlay).
struct PaddleState {
    ecs::Vec2 position = {0, 0};
    ecs::Vec2 velocity = {0, 0};
    ecs::Vec2 size     = {0, 0};
    bool      active   = true;
};

// ---------------------------------------------------------------------------
// Motion control
// ---------------------------------------------------------------------------

struct MotionConfig {
    bool  enable_smoothing = true;
    float smoothing_rate   = 0.15f; // fraction of remaining distance per 1/60 s
};

struct MotionConfigPatch {
    std::optional<bool>  enable_smoothing;
    std::optional<float> smoothing_rate;
};

// Controller state machine. Idle has no target; Tracking eases toward one.
struct Idle {};

struct Tracking {
    float target = 0.0f;
};

using MotionState = std::variant<Idle, Tracking>;

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

struct PaddleAppearance {
    Color4 color     = Colors::Paddle;
    float  y_offset  = 40.0f; // distance from the bottom edge of the field
};
