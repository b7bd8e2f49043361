#pragma once
#include "components.hpp"
#include "input_state.hpp"
#include "paddle.hpp"
#include <optional>

// ---------------------------------------------------------------------------
// PaddleMotionController
//
// Turns one InputSnapshot per tick into paddle commands.
//
//   Keyboard        -> move_left / move_right / stop_moving, target cleared.
//   Mouse / Touch   -> target = x - half_width. With smoothing the paddle
//                      eases toward it (frame-rate independent); without,
//                      it is placed there at once.
//   NoDevice / no x -> no command this tick.
//
// The paddle's own update(dt) is always called exactly once, last.
// Neither collaborator is owned; both must outlive the controller.
// ---------------------------------------------------------------------------

// What happened to the Idle/Tracking machine during the last update().
enum class MotionTransition {
    None,       // state unchanged (or Tracking continued toward the same target)
    Started,    // Idle -> Tracking
    Retargeted, // Tracking -> Tracking with a new target
    Settled,    // Tracking -> Idle by convergence
    Cancelled,  // Tracking -> Idle by keyboard or immediate mode
};

class PaddleMotionController {
public:
    // Below this distance the paddle snaps onto the target.
    static constexpr float CONVERGENCE_EPSILON = 1.0f;

    PaddleMotionController(PaddleBody& paddle, const InputSource& input,
                           const MotionConfig& config = {});

    void update(float dt);

    PaddleState paddle_state() const { return paddle_.state(); }

    // Merges engaged fields. Takes effect on the next update().
    void update_config(const MotionConfigPatch& patch);

    // Disabling drops any in-flight target.
    void set_smoothing_enabled(bool enabled);

    // Clamped to [0, 1]. 0 never moves toward the target, 1 snaps each tick.
    void set_smoothing_rate(float rate);

    // Forgets the target. The paddle and input source are left untouched.
    void destroy();

    const MotionConfig& config() const { return config_; }
    const MotionState&  state()  const { return state_; }
    bool                tracking() const;
    std::optional<float> target() const;
    MotionTransition    last_transition() const { return last_transition_; }

    PaddleBody&        paddle()       { return paddle_; }
    const InputSource& input()  const { return input_; }

private:
    void apply_keyboard(const KeyboardInput& keys);
    void apply_pointer(float x);
    void apply_smoothing(float dt);
    void clear_target(MotionTransition reason);

    PaddleBody&        paddle_;
    const InputSource& input_;
    MotionConfig       config_;
    MotionState        state_           = Idle{};
    MotionTransition   last_transition_ = MotionTransition::None;
};
