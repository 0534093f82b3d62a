#include "motion/core/constants.hpp"

namespace MotionConstants {

    const double DefaultSpringTension  = 342.0;
    const double DefaultSpringFriction = 30.0;
    const double DefaultSpringMass     = 1.0;

    const double DefaultSettlingEpsilon = 0.001;
    const double MaxSettlingDuration    = 60.0;

    // Display
    const unsigned int ScreenWidth    = 800;
    const unsigned int ScreenHeight   = 600;
    const unsigned int StepsPerSecond = 120;
    const int MaxTicksPerFrame        = 5;

    const double ExampleViewHalfSize = 64.0;

    double secondsPerTick() {
        return 1.0 / static_cast<double>(StepsPerSecond);
    }

} // namespace MotionConstants
