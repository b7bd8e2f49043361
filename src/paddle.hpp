#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PaddleBody — command surface the motion controller drives.
//
// The controller reads back only x() and half_width(); everything else is a
// command. update(dt) is the body's own integration step and is invoked once
// per controller tick, after the controller has issued its command.
// ---------------------------------------------------------------------------

class PaddleBody {
public:
    virtual ~PaddleBody() = default;

    virtual float x() const          = 0;
    virtual float half_width() const = 0;

    virtual void move_left()                  = 0;
    virtual void move_right()                 = 0;
    virtual void stop_moving()                = 0;
    virtual void set_target_position(float x) = 0; // absolute placement
    virtual void update(float dt)             = 0;

    virtual PaddleState state() const = 0;
};

// ---------------------------------------------------------------------------
// Paddle — horizontal paddle confined to [0, max_x - width].
// ---------------------------------------------------------------------------

class Paddle final : public PaddleBody {
public:
    explicit Paddle(const PaddleConfig& config, ecs::Vec2 position = {0, 0});

    float x() const override          { return position_.x; }
    float half_width() const override { return config_.width * 0.5f; }

    void move_left() override;
    void move_right() override;
    void stop_moving() override;
    void set_target_position(float x) override;
    void update(float dt) override;

    PaddleState state() const override;

    void update_config(const PaddleConfigPatch& patch);
    const PaddleConfig& config() const { return config_; }

    void set_active(bool active) { active_ = active; }
    bool active() const          { return active_; }

    void set_y(float y) { position_.y = y; }

private:
    float clamp_x(float x) const;

    PaddleConfig config_;
    ecs::Vec2    position_;
    ecs::Vec2    velocity_ = {0, 0};
    bool         active_   = true;
};
