/**
 * @file damped_oscillator.hpp
 * @brief Closed-form mass-spring-damper response
 *
 * Models m·x'' + c·x' + k·x = 0 where x is the displacement from the
 * spring's anchor. The response is linear in the initial conditions:
 *
 *     x(t)  = a(t)·x0  + b(t)·v0
 *     x'(t) = a'(t)·x0 + b'(t)·v0
 *
 * so an animated value only needs T±T and T·double to be evaluated.
 */

#ifndef MOTION_DAMPED_OSCILLATOR_HPP
#define MOTION_DAMPED_OSCILLATOR_HPP

#include "motion/core/constants.hpp"

namespace Math {

class DampedOscillator {
public:
    enum class Regime {
        Underdamped,
        CriticallyDamped,
        Overdamped
    };

    /**
     * @brief Weights applied to the initial displacement and initial velocity
     */
    struct Response {
        double displacement = 0.0;  ///< a(t)
        double velocity = 0.0;      ///< b(t)
    };

    /**
     * @param stiffness Spring constant k (tension)
     * @param damping Damping coefficient c (friction)
     * @param mass Mass m
     */
    DampedOscillator(double stiffness, double damping, double mass);

    /**
     * @brief False for non-positive stiffness or mass, negative damping,
     *        or non-finite parameters. Invalid oscillators settle instantly.
     */
    bool isValid() const { return valid; }

    double stiffness() const { return k; }
    double damping() const { return c; }
    double mass() const { return m; }

    /** @brief Undamped angular frequency sqrt(k/m) */
    double naturalFrequency() const { return omega0; }

    /** @brief c / (2·sqrt(k·m)) */
    double dampingRatio() const { return zeta; }

    Regime regime() const;

    /**
     * @brief Displacement weights at time t (seconds, clamped to >= 0)
     */
    Response response(double t) const;

    /**
     * @brief Velocity weights at time t, the time derivative of response()
     */
    Response velocityResponse(double t) const;

    /**
     * @brief Time until the decay envelope of a released spring falls below
     *        epsilon times its initial amplitude.
     *
     * Undamped springs never settle; the result is capped at
     * MotionConstants::MaxSettlingDuration.
     */
    double settlingDuration(double epsilon = MotionConstants::DefaultSettlingEpsilon) const;

private:
    double k;
    double c;
    double m;
    double omega0;
    double zeta;
    bool valid;
};

const char* toString(DampedOscillator::Regime regime);

} // namespace Math

#endif // MOTION_DAMPED_OSCILLATOR_HPP
