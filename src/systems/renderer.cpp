#include "renderer.hpp"
#include "../components.hpp"
#include "../paddle_session.hpp"
#include <raylib.h>
#include <algorithm>
#include <memory>

using namespace ecs;

static inline unsigned char to_byte(float v) {
    return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f);
}

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{to_byte(c.r), to_byte(c.g), to_byte(c.b), to_byte(c.a)};
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground({20, 22, 30, 255});

    DrawText("ARROWS / A,D: Move | MOUSE / TOUCH: Point | L: Smoothing | [ ]: Rate | F3: Debug",
             10, GetScreenHeight() - 20, 10, LIGHTGRAY);

    auto* session_ptr = world.try_resource<std::shared_ptr<PaddleSession>>();
    if (!session_ptr || !*session_ptr) return;
    const auto& session = **session_ptr;

    const PaddleState s = session.controller.paddle_state();
    if (!s.active) return;

    DrawRectangleRec({s.position.x, s.position.y, s.size.x, s.size.y},
                     to_raylib(session.appearance.color));

    // Pending smoothing target, drawn as a thin marker above the paddle.
    if (auto target = session.controller.target()) {
        const float cx = *target + s.size.x * 0.5f;
        DrawLineEx({cx, s.position.y - 8.0f}, {cx, s.position.y - 2.0f}, 2.0f, {200, 200, 200, 160});
    }
}

void EndFrameSystem::Update(World& /*world*/) {
    EndDrawing();
}
