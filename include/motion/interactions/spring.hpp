/**
 * @file spring.hpp
 * @brief Spring interaction driving one animatable property
 *
 * A spring pulls a property from its current value to a destination using
 * a damped oscillator. The spring only configures the motion: it builds a
 * SpringAnimation, snaps the property's model value to the destination and
 * hands the animation to the layer, which presents it over time.
 *
 * Lifecycle:
 * - enable()/disable() arm and disarm the interaction
 * - start()/stop() resume and suspend the simulation
 * - Animations are emitted only while enabled and not stopped, and only
 *   once a destination is set
 *
 * Every emitted animation is tracked by key until it completes. Changing
 * the destination while animations are in flight adds another animation;
 * earlier ones are left to finish on their own.
 */

#ifndef MOTION_SPRING_HPP
#define MOTION_SPRING_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <utility>

#include "motion/animation/i_animatable.hpp"
#include "motion/animation/spring_animation.hpp"
#include "motion/core/animation_key.hpp"
#include "motion/core/constants.hpp"
#include "motion/core/debug.hpp"
#include "motion/core/motion_state.hpp"
#include "motion/core/observable.hpp"
#include "motion/interactions/interaction.hpp"
#include "motion/math/subtractable.hpp"

namespace Interactions {

template <typename T>
class Spring : public ISpringInteraction<T>, public IStateful {
    static_assert(Math::is_subtractable_v<T>,
                  "Spring requires T - T, T + T and T * double");

public:
    using Property = Animation::IAnimatableProperty<T>;

    /**
     * @param property The property this spring animates. Must not be null.
     */
    explicit Spring(std::shared_ptr<Property> property)
        : path(std::move(property))
        , activation(std::make_shared<Activation>())
    {
    }

    ~Spring() override = default;

    Spring(const Spring&) = delete;
    Spring& operator=(const Spring&) = delete;

    void enable() override {
        if (enabled) {
            return;
        }
        enabled = true;

        checkAndEmit();
    }

    void disable() override {
        if (!enabled) {
            return;
        }
        enabled = false;

        removeActiveAnimations();
    }

    void start() override {
        if (!stopped) {
            return;
        }
        stopped = false;

        checkAndEmit();
    }

    void stop() override {
        if (stopped) {
            return;
        }
        stopped = true;

        removeActiveAnimations();
    }

    bool isEnabled() const { return enabled; }
    bool isStopped() const { return stopped; }

    /**
     * @brief The destination value. Setting it immediately emits a new
     *        animation when the spring is enabled and running.
     */
    const std::optional<T>& destination() const override { return target; }

    void setDestination(const T& destination) override {
        target = destination;
        checkAndEmit();
    }

    void clearDestination() override {
        target.reset();
        checkAndEmit();
    }

    /**
     * @brief Velocity of the value when an animation starts.
     *
     * Read only when an animation is emitted; animations in flight are not
     * affected by later changes.
     */
    const std::optional<T>& initialVelocity() const override { return velocity; }

    void setInitialVelocity(std::optional<T> v) override { velocity = std::move(v); }

    /**
     * @brief How quickly the value moves towards its destination.
     *
     * Higher tension means higher initial velocity and more overshoot.
     */
    double tension() const { return springTension; }
    void setTension(double value) { springTension = value; }

    /**
     * @brief How quickly the value's velocity slows down.
     *
     * Higher friction means quicker deceleration and less overshoot.
     */
    double friction() const { return springFriction; }
    void setFriction(double value) { springFriction = value; }

    /**
     * @brief Higher mass means slower acceleration and deceleration.
     */
    double mass() const { return springMass; }
    void setMass(double value) { springMass = value; }

    /**
     * @brief Fixed duration in seconds. 0 uses the natural settling duration.
     */
    double suggestedDuration() const { return duration; }
    void setSuggestedDuration(double seconds) { duration = seconds; }

    Motion::Observable<Motion::MotionState>& state() override { return activation->state; }

    bool isActive() const { return !activation->keys.empty(); }
    std::size_t activeAnimationCount() const { return activation->keys.size(); }

    const std::shared_ptr<Property>& property() const { return path; }

private:
    // Shared with completion callbacks, which may outlive the spring
    struct Activation {
        std::set<Motion::AnimationKey> keys;
        Motion::Observable<Motion::MotionState> state{Motion::MotionState::AtRest};
    };

    void checkAndEmit() {
        if (!enabled || stopped || !target) {
            return;
        }

        auto const key = Motion::AnimationKey::generate();

        Animation::SpringAnimation<T> animation;
        animation.stiffness = springTension;
        animation.damping   = springFriction;
        animation.mass      = springMass;
        animation.from      = path->value();
        animation.to        = *target;

        if (duration != 0) {
            animation.duration = duration;
        } else {
            animation.duration = animation.settlingDuration();
        }

        path->setValue(*target);

        activation->keys.insert(key);
        activation->state.set(Motion::MotionState::Active);

        // An observer of the Active transition may have disabled or stopped us
        if (activation->keys.count(key) == 0) {
            return;
        }

        MotionStats::recordEmission();
        MOTION_DEBUG(DEBUG_LEVEL_VERBOSE,
            "Spring emit " << key << " duration " << animation.duration << "s, "
            << activation->keys.size() << " active\n");

        std::shared_ptr<Activation> tracked = activation;
        path->add(animation, key, velocity, [tracked, key]() {
            tracked->keys.erase(key);
            MotionStats::recordCompletion();
            if (tracked->keys.empty()) {
                tracked->state.set(Motion::MotionState::AtRest);
            }
        });
    }

    void removeActiveAnimations() {
        auto const keys = std::exchange(activation->keys, {});
        for (const auto& key : keys) {
            path->removeAnimation(key);
            MotionStats::recordCancellation();
        }
        activation->state.set(Motion::MotionState::AtRest);
    }

    std::shared_ptr<Property> path;
    std::shared_ptr<Activation> activation;

    bool enabled = false;
    bool stopped = false;

    std::optional<T> target;
    std::optional<T> velocity;

    double springTension  = MotionConstants::DefaultSpringTension;
    double springFriction = MotionConstants::DefaultSpringFriction;
    double springMass     = MotionConstants::DefaultSpringMass;
    double duration       = 0.0;
};

} // namespace Interactions

#endif // MOTION_SPRING_HPP
