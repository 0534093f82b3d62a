/**
 * @file spring_animation.hpp
 * @brief Descriptor for one spring animation submitted to a layer
 */

#ifndef MOTION_SPRING_ANIMATION_HPP
#define MOTION_SPRING_ANIMATION_HPP

#include <optional>

#include "motion/core/constants.hpp"
#include "motion/math/damped_oscillator.hpp"
#include "motion/math/subtractable.hpp"

namespace Animation {

/**
 * @struct SpringAnimation
 * @brief Physical parameters, endpoints and duration of a spring animation
 *
 * The descriptor is immutable once submitted; the layer evaluates it
 * against its own clock.
 */
template <typename T>
struct SpringAnimation {
    static_assert(Math::is_subtractable_v<T>,
                  "SpringAnimation requires T - T, T + T and T * double");

    double stiffness = MotionConstants::DefaultSpringTension;
    double damping   = MotionConstants::DefaultSpringFriction;
    double mass      = MotionConstants::DefaultSpringMass;

    T from{};
    T to{};

    double duration = 0.0;  ///< Seconds

    Math::DampedOscillator oscillator() const {
        return Math::DampedOscillator(stiffness, damping, mass);
    }

    /**
     * @brief Natural settling time for these parameters
     */
    double settlingDuration() const {
        return oscillator().settlingDuration();
    }

    /**
     * @brief Presentation value at time t seconds after the animation began
     *
     * Reaches exactly `to` once t >= duration.
     */
    T valueAt(double t, const std::optional<T>& initialVelocity) const {
        if (t >= duration) {
            return to;
        }
        auto const r = oscillator().response(t);
        T value = to + (from - to) * r.displacement;
        if (initialVelocity) {
            value = value + (*initialVelocity) * r.velocity;
        }
        return value;
    }

    /**
     * @brief Presentation velocity at time t; zero once settled
     */
    T velocityAt(double t, const std::optional<T>& initialVelocity) const {
        if (t >= duration) {
            return (to - to);
        }
        auto const r = oscillator().velocityResponse(t);
        T velocity = (from - to) * r.displacement;
        if (initialVelocity) {
            velocity = velocity + (*initialVelocity) * r.velocity;
        }
        return velocity;
    }
};

} // namespace Animation

#endif // MOTION_SPRING_ANIMATION_HPP
