#pragma once
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../paddle_session.hpp"
#include "../paddle_telemetry.hpp"
#include "../pipeline.hpp"
#include "../settings.hpp"
#include "../systems/hotkeys.hpp"
#include "../systems/paddle_control.hpp"
#include "../systems/paddle_telemetry.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// PaddleModule
//
// Creates the PaddleSession from the GameSettings resource, registers the
// event queues PaddleControlSystem emits (DeviceChangedEvent,
// PaddleSettledEvent), wires HotkeySystem, PaddleControlSystem and
// PaddleTelemetrySystem into the Logic phase in that order, and adds the
// "Paddle" debug rows and field strip.
//
// Requires CoreModule. Install after DebugModule to get the debug rows.
// ---------------------------------------------------------------------------

struct PaddleModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        const auto& settings = world.resource<GameSettings>();
        auto session = std::make_shared<PaddleSession>(settings);

        TraceLog(LOG_INFO, "PADDLE: %.0fx%.0f, speed %.0f, smoothing %s (rate %.2f)",
                 settings.paddle.width, settings.paddle.height, settings.paddle.speed,
                 settings.motion.enable_smoothing ? "on" : "off",
                 session->controller.config().smoothing_rate);

        world.set_resource(std::move(session));

        world.resource<EventRegistry>().register_queue<DeviceChangedEvent>(world);
        world.resource<EventRegistry>().register_queue<PaddleSettledEvent>(world);
        world.set_resource(PaddleTelemetry{});

        // Hotkeys first so a toggle applies to this frame's tick
        pipeline.add_logic([](ecs::World& w, float)    { HotkeySystem::Update(w); });
        pipeline.add_logic([](ecs::World& w, float dt) { PaddleControlSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float)    { PaddleTelemetrySystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Paddle", "X", [&world]() {
                char b[16];
                std::snprintf(b, sizeof(b), "%.1f", session_of(world).paddle.x());
                return std::string(b);
            });
            panel->watch("Paddle", "Velocity", [&world]() {
                char b[16];
                std::snprintf(b, sizeof(b), "%.0f", session_of(world).paddle.state().velocity.x);
                return std::string(b);
            });
            panel->watch("Paddle", "Motion", [&world]() {
                auto target = session_of(world).controller.target();
                if (!target) return std::string("Idle");
                char b[32];
                std::snprintf(b, sizeof(b), "Tracking %.1f", *target);
                return std::string(b);
            }, [&world]() { return session_of(world).controller.tracking(); });
            panel->watch("Paddle", "Device", [&world]() {
                return std::string(device_name(session_of(world).input.active_device()));
            });
            panel->watch("Paddle", "Smoothing", [&world]() {
                const auto& cfg = session_of(world).controller.config();
                char b[24];
                std::snprintf(b, sizeof(b), "%s @ %.2f", cfg.enable_smoothing ? "On" : "Off",
                              cfg.smoothing_rate);
                return std::string(b);
            }, [&world]() { return !session_of(world).controller.config().enable_smoothing; });
            panel->watch("Paddle", "Switches", [&world]() {
                const auto& t = world.resource<PaddleTelemetry>();
                if (t.device_switches == 0) return std::string("0");
                char b[40];
                std::snprintf(b, sizeof(b), "%d (%s -> %s)", t.device_switches,
                              device_name(t.switched_from), device_name(t.switched_to));
                return std::string(b);
            });
            panel->watch("Paddle", "Settles", [&world]() {
                const auto& t = world.resource<PaddleTelemetry>();
                if (!t.last_settle_x) return std::string("0");
                char b[32];
                std::snprintf(b, sizeof(b), "%d @ %.1f", t.settles, *t.last_settle_x);
                return std::string(b);
            });
            // Track is the paddle's travel range; the marker is the pending
            // target's center, matching the renderer's marker.
            panel->strip("Paddle", "Field", [&world]() {
                const auto& session = session_of(world);
                const PaddleState s = session.paddle.state();
                StripValue v;
                v.lo      = 0.0f;
                v.hi      = session.paddle.config().max_x;
                v.span_lo = s.position.x;
                v.span_hi = s.position.x + s.size.x;
                if (auto target = session.controller.target()) v.marker = *target + s.size.x * 0.5f;
                return v;
            });
        }
    }

private:
    static PaddleSession& session_of(ecs::World& world) {
        return *world.resource<std::shared_ptr<PaddleSession>>();
    }
};
