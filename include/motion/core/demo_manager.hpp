/**
 * @file demo_manager.hpp
 * @brief Main loop of the spring demo: events, compositor ticks, rendering.
 */

#pragma once

#include <SFML/System/Clock.hpp>

#include "motion/core/compositor_host.hpp"
#include "motion/demo/spring_example.hpp"
#include "motion/rendering/renderer.hpp"

/**
 * @class DemoManager
 * @brief Owns the renderer, the compositor and the demo screen
 */
class DemoManager {
public:
    DemoManager();

    /**
     * @brief Opens the window and runs until it is closed.
     * @return Process exit code
     */
    int run();

private:
    bool init();

    /**
     * @brief Processes window events for the current frame.
     */
    void handleEvents();

    void render(float fps);

    Renderer renderer;
    CompositorHost compositor;
    SpringExample example;

    bool running;
};
