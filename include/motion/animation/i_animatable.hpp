/**
 * @file i_animatable.hpp
 * @brief The host compositor as seen by an interaction
 */

#pragma once

#include <functional>
#include <optional>

#include "motion/animation/spring_animation.hpp"
#include "motion/core/animation_key.hpp"

namespace Animation {

using CompletionCallback = std::function<void()>;

/**
 * @class IAnimatableProperty
 * @brief One animatable property of a layer
 *
 * The model value is what the property holds; animations only change how
 * it is presented. Implementations run animations to completion over time
 * and call the completion exactly once per animation that finishes on its
 * own. Removing an animation drops its completion.
 */
template <typename T>
class IAnimatableProperty {
public:
    virtual ~IAnimatableProperty() = default;

    /** @brief Current model value */
    virtual T value() const = 0;

    /** @brief Replaces the model value without animating */
    virtual void setValue(const T& value) = 0;

    /**
     * @brief Starts an animation under the given key
     *
     * @param animation Descriptor to run
     * @param key Unique key, used by removeAnimation()
     * @param initialVelocity Velocity of the value when the animation begins
     * @param onComplete Called once when the animation finishes
     */
    virtual void add(const SpringAnimation<T>& animation,
                     Motion::AnimationKey key,
                     const std::optional<T>& initialVelocity,
                     CompletionCallback onComplete) = 0;

    /**
     * @brief Cancels the animation with the given key, if any
     */
    virtual void removeAnimation(Motion::AnimationKey key) = 0;
};

} // namespace Animation
