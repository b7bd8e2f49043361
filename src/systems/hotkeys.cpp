#include "hotkeys.hpp"
#include "../paddle_session.hpp"
#include <raylib.h>
#include <memory>

void HotkeySystem::Update(ecs::World& world) {
    auto* session_ptr = world.try_resource<std::shared_ptr<PaddleSession>>();
    if (!session_ptr || !*session_ptr) return;
    auto& controller = (*session_ptr)->controller;

    if (IsKeyPressed(KEY_L)) {
        const bool enabled = !controller.config().enable_smoothing;
        controller.set_smoothing_enabled(enabled);
        TraceLog(LOG_INFO, "PADDLE: Smoothing %s", enabled ? "enabled" : "disabled");
    }

    float step = 0.0f;
    if (IsKeyPressed(KEY_LEFT_BRACKET))  step -= RATE_STEP;
    if (IsKeyPressed(KEY_RIGHT_BRACKET)) step += RATE_STEP;
    if (step != 0.0f) {
        controller.set_smoothing_rate(controller.config().smoothing_rate + step);
        TraceLog(LOG_INFO, "PADDLE: Smoothing rate %.2f", controller.config().smoothing_rate);
    }
}
