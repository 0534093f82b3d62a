#pragma once

namespace Motion {

/**
 * @brief Aggregate state of an interaction's running animations
 */
enum class MotionState {
    AtRest,
    Active
};

const char* toString(MotionState state);

} // namespace Motion
