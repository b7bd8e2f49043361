#pragma once
#include <cmath>
#include <algorithm>

namespace arcade::math {

// Ticks per second the smoothing rate is expressed against.
inline constexpr float REFERENCE_HZ = 60.0f;

/**
 * @brief Clamps a per-tick interpolation rate into [0, 1].
 */
inline float clamp_rate(float rate) {
    if (std::isnan(rate)) return 0.0f;
    return std::clamp(rate, 0.0f, 1.0f);
}

/**
 * @brief Frame-rate independent smoothing factor.
 *
 * rate is the fraction of remaining distance closed per 1/60 s tick.
 * Returns the fraction to close over dt seconds: 1 - (1 - rate)^(dt * 60).
 * Composing N steps of dt/N closes exactly the same fraction as one step of dt.
 */
inline float smoothing_factor(float rate, float dt) {
    return 1.0f - std::pow(1.0f - clamp_rate(rate), dt * REFERENCE_HZ);
}

/**
 * @brief Moves current toward target by the given fraction of the gap.
 */
inline float approach(float current, float target, float factor) {
    return current + (target - current) * factor;
}

} // namespace arcade::math
