#include "input_arbiter.hpp"

int InputArbiter::priority(InputDevice d) {
    switch (d) {
        case InputDevice::Touch:    return 3;
        case InputDevice::Mouse:    return 2;
        case InputDevice::Keyboard: return 1;
        default:                    return 0;
    }
}

void InputArbiter::engage(InputDevice d) {
    if (priority(active_) > priority(d)) return;
    active_ = d;
}

void InputArbiter::begin_frame() {
    mouse_fresh_ = false;
    touch_fresh_ = false;
}

void InputArbiter::key_down(PaddleKey key) {
    if (!enables_.keyboard) return;
    keys_[static_cast<int>(key)] = true;
    engage(InputDevice::Keyboard);
}

void InputArbiter::key_up(PaddleKey key) {
    if (!enables_.keyboard) return;
    keys_[static_cast<int>(key)] = false;
    engage(InputDevice::Keyboard);
}

void InputArbiter::mouse_move(float x) {
    if (!enables_.mouse) return;
    mouse_x_     = x;
    mouse_fresh_ = true;
    engage(InputDevice::Mouse);
}

void InputArbiter::mouse_leave() {
    if (active_ == InputDevice::Mouse) active_ = InputDevice::None;
}

void InputArbiter::touch_move(float x) {
    if (!enables_.touch) return;
    if (touch_down_ && x == touch_x_) return; // finger resting
    touch_down_  = true;
    touch_x_     = x;
    touch_fresh_ = true;
    engage(InputDevice::Touch);
}

void InputArbiter::touch_end() {
    touch_down_ = false;
    if (active_ == InputDevice::Touch) active_ = InputDevice::None;
}

void InputArbiter::reset() {
    for (bool& k : keys_) k = false;
    active_      = InputDevice::None;
    mouse_fresh_ = false;
    touch_fresh_ = false;
    touch_down_  = false;
}

void InputArbiter::set_enables(const InputEnables& enables) {
    enables_ = enables;
    if ((active_ == InputDevice::Keyboard && !enables_.keyboard) ||
        (active_ == InputDevice::Mouse    && !enables_.mouse)    ||
        (active_ == InputDevice::Touch    && !enables_.touch)) {
        active_ = InputDevice::None;
    }
}

InputSnapshot InputArbiter::snapshot() const {
    switch (active_) {
        case InputDevice::Keyboard: {
            KeyboardInput k;
            k.left  = key_held(PaddleKey::Left)  || key_held(PaddleKey::A);
            k.right = key_held(PaddleKey::Right) || key_held(PaddleKey::D);
            return k;
        }
        case InputDevice::Mouse: {
            PointerInput p;
            if (mouse_fresh_) p.x = mouse_x_;
            return p;
        }
        case InputDevice::Touch: {
            TouchInput t;
            if (touch_fresh_) t.x = touch_x_;
            return t;
        }
        default:                 return NoDevice{};
    }
}
