/**
 * @file interaction.hpp
 * @brief Interfaces shared by all interactions
 */

#pragma once

#include <optional>

#include "motion/core/motion_state.hpp"
#include "motion/core/observable.hpp"

namespace Interactions {

/**
 * @class IInteraction
 * @brief An interaction that can be armed and disarmed
 *
 * Both calls are idempotent.
 */
class IInteraction {
public:
    virtual ~IInteraction() = default;

    virtual void enable() = 0;
    virtual void disable() = 0;
};

/**
 * @class IStateful
 * @brief Exposes whether an interaction currently has motion in flight
 */
class IStateful {
public:
    virtual ~IStateful() = default;

    virtual Motion::Observable<Motion::MotionState>& state() = 0;
};

/**
 * @class ISpringInteraction
 * @brief An interaction that pulls a value of type T toward a destination
 */
template <typename T>
class ISpringInteraction : public IInteraction {
public:
    virtual void start() = 0;
    virtual void stop() = 0;

    virtual const std::optional<T>& destination() const = 0;
    virtual void setDestination(const T& destination) = 0;
    virtual void clearDestination() = 0;

    virtual const std::optional<T>& initialVelocity() const = 0;
    virtual void setInitialVelocity(std::optional<T> velocity) = 0;
};

} // namespace Interactions
