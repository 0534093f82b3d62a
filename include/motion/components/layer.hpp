#ifndef MOTION_COMPONENTS_LAYER_HPP
#define MOTION_COMPONENTS_LAYER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "motion/animation/i_animatable.hpp"
#include "motion/animation/spring_animation.hpp"
#include "motion/core/animation_key.hpp"

namespace Components {

    // Value the property holds. Springs write their destination here
    // as soon as they emit.
    template <typename T>
    struct ModelValue {
        T value;
    };

    // Value currently displayed, recomputed by the compositor every tick
    template <typename T>
    struct PresentationValue {
        T value;
    };

    template <typename T>
    struct RunningAnimation {
        Motion::AnimationKey key;
        Animation::SpringAnimation<T> animation;
        std::optional<T> initialVelocity;
        double elapsed = 0.0;  // seconds
        Animation::CompletionCallback onComplete;
    };

    // Animations on one property, oldest first. The newest one drives
    // the presentation value.
    template <typename T>
    struct AnimationTrack {
        std::vector<RunningAnimation<T>> running;
    };

    // Square layer, size = half side length in pixels
    struct Shape {
        double halfSize;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

    struct CompositorClock {
        double timeScale = 1.0;
        double elapsedSeconds = 0.0;

        CompositorClock(double ts = 1.0)
            : timeScale(ts) {}
    };

} // namespace Components

#endif // MOTION_COMPONENTS_LAYER_HPP
