#pragma once
#include "input_arbiter.hpp"
#include "paddle.hpp"
#include "paddle_controller.hpp"
#include "settings.hpp"

// ---------------------------------------------------------------------------
// PaddleSession — one paddle, its input arbiter and the controller that
// binds them, for the lifetime of a game session.
//
// The controller holds references into the same object, so a session is
// neither copyable nor movable. Store it in the World as a shared_ptr.
// ---------------------------------------------------------------------------

struct PaddleSession {
    explicit PaddleSession(const GameSettings& settings)
        : paddle(settings.paddle, start_position(settings)),
          input(settings.input),
          controller(paddle, input, settings.motion),
          appearance(settings.appearance) {}

    ~PaddleSession() { controller.destroy(); }

    PaddleSession(const PaddleSession&)            = delete;
    PaddleSession& operator=(const PaddleSession&) = delete;

    Paddle                 paddle;
    InputArbiter           input;
    PaddleMotionController controller;
    PaddleAppearance       appearance;

    // Last device seen by PaddleControlSystem, for change detection.
    InputDevice last_device = InputDevice::None;

private:
    // Centered horizontally, y_offset above the bottom edge.
    static ecs::Vec2 start_position(const GameSettings& s) {
        const float x = (static_cast<float>(s.window.width) - s.paddle.width) * 0.5f;
        const float y = static_cast<float>(s.window.height) - s.appearance.y_offset - s.paddle.height;
        return {x, y};
    }
};
