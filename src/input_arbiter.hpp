#pragma once
#include "input_state.hpp"

// ---------------------------------------------------------------------------
// InputArbiter — folds raw device events into one authoritative InputSnapshot.
//
// Priority: Touch > Mouse > Keyboard. An event from a lower-priority device
// is ignored while a higher-priority device is engaged. Touch disengages on
// touch_end(), the mouse on mouse_leave(); after that any device may take over.
// No raylib dependency: InputGatherSystem translates raylib polling into
// these calls, opening each frame with begin_frame().
//
// Pointer and touch coordinates are reported only in the frame they changed;
// an engaged device that did not move reports an absent x. touch_move() may
// be fed every frame while a finger is down: a repeat of the last x is not
// new input.
// ---------------------------------------------------------------------------

enum class PaddleKey { Left, Right, A, D };

struct InputEnables {
    bool keyboard = true;
    bool mouse    = true;
    bool touch    = true;
};

class InputArbiter final : public InputSource {
public:
    explicit InputArbiter(InputEnables enables = {}) : enables_(enables) {}

    // Clears the per-frame coordinate freshness. Held keys and the engaged
    // device carry over.
    void begin_frame();

    void key_down(PaddleKey key);
    void key_up(PaddleKey key);
    void mouse_move(float x);
    void mouse_leave();
    void touch_move(float x);
    void touch_end();

    // Drops all held keys and disengages every device.
    void reset();

    InputSnapshot snapshot() const override;

    InputDevice active_device() const { return active_; }
    bool key_held(PaddleKey key) const { return keys_[static_cast<int>(key)]; }

    void set_enables(const InputEnables& enables);
    const InputEnables& enables() const { return enables_; }

private:
    static int priority(InputDevice d);
    void engage(InputDevice d);

    InputEnables enables_;
    InputDevice  active_     = InputDevice::None;
    bool         keys_[4]    = {false, false, false, false};
    float        mouse_x_    = 0.0f;
    float        touch_x_    = 0.0f;
    bool         mouse_fresh_ = false;
    bool         touch_fresh_ = false;
    bool         touch_down_  = false;
};
