#include "input_gather.hpp"
#include "../paddle_session.hpp"
#include <raylib.h>
#include <memory>

struct KeyBinding {
    int       raylib_key;
    PaddleKey key;
};

static constexpr KeyBinding BINDINGS[] = {
    {KEY_LEFT,  PaddleKey::Left},
    {KEY_RIGHT, PaddleKey::Right},
    {KEY_A,     PaddleKey::A},
    {KEY_D,     PaddleKey::D},
};

void InputGatherSystem::Update(ecs::World& world) {
    auto* session_ptr = world.try_resource<std::shared_ptr<PaddleSession>>();
    if (!session_ptr || !*session_ptr) return;
    auto& input = (*session_ptr)->input;

    input.begin_frame();

    // 1. Keyboard (edges only, like key down / key up events)
    for (const auto& b : BINDINGS) {
        if (IsKeyPressed(b.raylib_key))  input.key_down(b.key);
        if (IsKeyReleased(b.raylib_key)) input.key_up(b.key);
    }

    // 2. Mouse (only actual movement counts)
    if (!IsCursorOnScreen()) {
        input.mouse_leave();
    } else {
        Vector2 delta = GetMouseDelta();
        if (delta.x != 0.0f || delta.y != 0.0f) {
            input.mouse_move(GetMousePosition().x);
        }
    }

    // 3. Touch (first contact point)
    if (GetTouchPointCount() > 0) {
        input.touch_move(GetTouchPosition(0).x);
    } else {
        input.touch_end();
    }
}
