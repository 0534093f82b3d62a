#include "motion/core/motion_state.hpp"

namespace Motion {

const char* toString(MotionState state) {
    switch (state) {
        case MotionState::AtRest: return "AT_REST";
        case MotionState::Active: return "ACTIVE";
        default: return "UNKNOWN";
    }
}

} // namespace Motion
