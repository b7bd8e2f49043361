#include "paddle_controller.hpp"
#include "math_util.hpp"
#include <cmath>

using namespace arcade::math;

PaddleMotionController::PaddleMotionController(PaddleBody& paddle,
                                               const InputSource& input,
                                               const MotionConfig& config)
    : paddle_(paddle), input_(input), config_(config) {
    config_.smoothing_rate = clamp_rate(config_.smoothing_rate);
}

bool PaddleMotionController::tracking() const {
    return std::holds_alternative<Tracking>(state_);
}

std::optional<float> PaddleMotionController::target() const {
    if (const auto* t = std::get_if<Tracking>(&state_)) return t->target;
    return std::nullopt;
}

void PaddleMotionController::clear_target(MotionTransition reason) {
    if (tracking()) last_transition_ = reason;
    state_ = Idle{};
}

void PaddleMotionController::update(float dt) {
    last_transition_ = MotionTransition::None;

    const InputSnapshot input = input_.snapshot();

    // 1. Device arbitration
    if (const auto* keys = std::get_if<KeyboardInput>(&input)) {
        apply_keyboard(*keys);
    } else if (const auto* pointer = std::get_if<PointerInput>(&input)) {
        if (pointer->x) apply_pointer(*pointer->x);
    } else if (const auto* touch = std::get_if<TouchInput>(&input)) {
        if (touch->x) apply_pointer(*touch->x);
    }

    // 2. Smoothing toward the pending target
    if (config_.enable_smoothing) apply_smoothing(dt);

    // 3. Paddle integration, strictly after the command above
    paddle_.update(dt);
}

void PaddleMotionController::apply_keyboard(const KeyboardInput& keys) {
    if (keys.left && !keys.right) {
        paddle_.move_left();
    } else if (keys.right && !keys.left) {
        paddle_.move_right();
    } else {
        paddle_.stop_moving();
    }
    clear_target(MotionTransition::Cancelled);
}

void PaddleMotionController::apply_pointer(float x) {
    const float centered = x - paddle_.half_width();

    if (!config_.enable_smoothing) {
        paddle_.set_target_position(centered);
        clear_target(MotionTransition::Cancelled);
        return;
    }

    if (auto* t = std::get_if<Tracking>(&state_)) {
        if (t->target != centered) last_transition_ = MotionTransition::Retargeted;
        t->target = centered;
    } else {
        state_           = Tracking{centered};
        last_transition_ = MotionTransition::Started;
    }
    paddle_.stop_moving(); // cancel any keyboard velocity
}

void PaddleMotionController::apply_smoothing(float dt) {
    const auto* t = std::get_if<Tracking>(&state_);
    if (!t) return;

    const float target   = t->target;
    const float current  = paddle_.x();
    const float distance = target - current;

    paddle_.set_target_position(approach(current, target,
                                         smoothing_factor(config_.smoothing_rate, dt)));

    if (std::abs(distance) < CONVERGENCE_EPSILON) {
        paddle_.set_target_position(target);
        state_           = Idle{};
        last_transition_ = MotionTransition::Settled;
    }
}

void PaddleMotionController::update_config(const MotionConfigPatch& patch) {
    if (patch.enable_smoothing) set_smoothing_enabled(*patch.enable_smoothing);
    if (patch.smoothing_rate)   set_smoothing_rate(*patch.smoothing_rate);
}

void PaddleMotionController::set_smoothing_enabled(bool enabled) {
    config_.enable_smoothing = enabled;
    if (!enabled) clear_target(MotionTransition::Cancelled);
}

void PaddleMotionController::set_smoothing_rate(float rate) {
    config_.smoothing_rate = clamp_rate(rate);
}

void PaddleMotionController::destroy() {
    state_           = Idle{};
    last_transition_ = MotionTransition::None;
}
