#include "paddle_control.hpp"
#include "../events.hpp"
#include "../paddle_session.hpp"
#include <memory>

using namespace ecs;

void PaddleControlSystem::Update(World& world, float dt) {
    auto* session_ptr = world.try_resource<std::shared_ptr<PaddleSession>>();
    if (!session_ptr || !*session_ptr) return;
    auto& session = **session_ptr;

    const InputDevice device = session.input.active_device();
    if (device != session.last_device) {
        if (auto* q = world.try_resource<Events<DeviceChangedEvent>>()) {
            q->send({session.last_device, device});
        }
        session.last_device = device;
    }

    session.controller.update(dt);

    if (session.controller.last_transition() == MotionTransition::Settled) {
        if (auto* q = world.try_resource<Events<PaddleSettledEvent>>()) {
            q->send({session.paddle.x()});
        }
    }
}
