#ifndef MOTION_CONSTANTS_HPP
#define MOTION_CONSTANTS_HPP

namespace MotionConstants {

    // Spring defaults shared by every spring interaction. Each spring copies
    // these at construction; they are never mutated at runtime.
    extern const double DefaultSpringTension;
    extern const double DefaultSpringFriction;
    extern const double DefaultSpringMass;

    // Relative amplitude below which a spring is considered settled
    extern const double DefaultSettlingEpsilon;

    // Upper bound on computed settling durations (seconds)
    extern const double MaxSettlingDuration;

    // Display
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;
    extern const int MaxTicksPerFrame;

    // Size of the demo square (half side length, pixels)
    extern const double ExampleViewHalfSize;

    /**
     * @brief Fixed compositor time step in seconds.
     */
    double secondsPerTick();
}

#endif // MOTION_CONSTANTS_HPP
