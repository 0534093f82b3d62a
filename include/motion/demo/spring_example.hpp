/**
 * @file spring_example.hpp
 * @brief Demo screen: a square that springs to wherever the user taps.
 */

#pragma once

#include <memory>
#include <random>

#include <entt/entt.hpp>

#include "motion/animation/key_path.hpp"
#include "motion/core/compositor_host.hpp"
#include "motion/interactions/aggregate_motion_state.hpp"
#include "motion/interactions/spring.hpp"
#include "motion/math/vector_math.hpp"

/**
 * @class SpringExample
 * @brief Centers one square layer in the view and moves it with a spring
 *        on every tap.
 *
 * The spring uses half the default friction so the motion overshoots
 * visibly.
 */
class SpringExample {
public:
    /**
     * @param host Compositor owning the layer; must outlive the example
     * @param width View width in pixels
     * @param height View height in pixels
     * @param seed Seed for the destination generator
     */
    SpringExample(CompositorHost& host, double width, double height, unsigned int seed);
    ~SpringExample();

    SpringExample(const SpringExample&) = delete;
    SpringExample& operator=(const SpringExample&) = delete;

    /**
     * @brief Sends the square to a random point inside the view.
     *
     * The tap location itself is not used.
     */
    void handleTap(double x, double y);

    /**
     * @brief Stops the spring and puts the square back in the center
     */
    void recenter();

    static const char* title();
    static const char* instructions();

    Position viewCenter() const;
    double viewWidth() const { return width; }
    double viewHeight() const { return height; }

    entt::entity square() const { return squareLayer; }
    Animation::KeyPath<Position>& squarePosition() { return *positionPath; }
    Interactions::Spring<Position>& spring() { return *positionSpring; }
    Interactions::AggregateMotionState& motionState() { return aggregate; }

private:
    double width;
    double height;

    entt::entity squareLayer;
    std::shared_ptr<Animation::KeyPath<Position>> positionPath;
    std::unique_ptr<Interactions::Spring<Position>> positionSpring;
    Interactions::AggregateMotionState aggregate;

    std::mt19937 rng;
};
