#include "paddle.hpp"
#include <algorithm>

Paddle::Paddle(const PaddleConfig& config, ecs::Vec2 position)
    : config_(config), position_(position) {}

float Paddle::clamp_x(float x) const {
    const float right = std::max(0.0f, config_.max_x - config_.width);
    return std::clamp(x, 0.0f, right);
}

void Paddle::move_left()   { velocity_.x = -config_.speed; }
void Paddle::move_right()  { velocity_.x =  config_.speed; }
void Paddle::stop_moving() { velocity_.x = 0.0f; }

void Paddle::set_target_position(float x) {
    position_.x = clamp_x(x);
    velocity_.x = 0.0f; // direct placement cancels keyboard motion
}

void Paddle::update(float dt) {
    if (!active_) return;

    position_.x += velocity_.x * dt;
    position_.y += velocity_.y * dt;
    position_.x  = clamp_x(position_.x);
}

PaddleState Paddle::state() const {
    PaddleState s;
    s.position = position_;
    s.velocity = velocity_;
    s.size     = {config_.width, config_.height};
    s.active   = active_;
    return s;
}

void Paddle::update_config(const PaddleConfigPatch& patch) {
    if (patch.width)  config_.width  = *patch.width;
    if (patch.height) config_.height = *patch.height;
    if (patch.speed)  config_.speed  = *patch.speed;
    if (patch.max_x)  config_.max_x  = *patch.max_x;
}
