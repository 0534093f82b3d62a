/**
 * @file demo_manager.cpp
 * @brief Implementation of DemoManager.
 */

#include "motion/core/demo_manager.hpp"

#include <iostream>
#include <random>
#include <string>

#include <SFML/Window/Event.hpp>

#include "motion/core/constants.hpp"
#include "motion/core/debug.hpp"
#include "motion/core/profile.hpp"

DemoManager::DemoManager()
    : renderer(MotionConstants::ScreenWidth, MotionConstants::ScreenHeight)
    , compositor()
    , example(compositor,
              MotionConstants::ScreenWidth,
              MotionConstants::ScreenHeight,
              std::random_device{}())
    , running(false)
{
}

bool DemoManager::init() {
    if (!renderer.init()) {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }
    return true;
}

int DemoManager::run() {
    if (!init()) {
        return 1;
    }

    sf::Clock frameClock;
    sf::Time accumulator = sf::Time::Zero;
    const sf::Time fixedTickDt = sf::seconds(static_cast<float>(MotionConstants::secondsPerTick()));

    running = true;
    while (running && renderer.isWindowOpen()) {
        sf::Time const dt = frameClock.restart();
        accumulator += dt;

        handleEvents();
        if (!running) {
            break;
        }

        // Fixed time step, bounded so a stall cannot spiral
        int ticksThisFrame = 0;
        while (accumulator >= fixedTickDt && ticksThisFrame < MotionConstants::MaxTicksPerFrame) {
            compositor.tick();
            accumulator -= fixedTickDt;
            ticksThisFrame++;
        }
        if (ticksThisFrame == MotionConstants::MaxTicksPerFrame) {
            accumulator = sf::Time::Zero;
        }

        float const fps = dt.asSeconds() > 0.f ? 1.f / dt.asSeconds() : 0.f;
        render(fps);
    }

    renderer.getWindow().close();

    MotionStats::print();
    Profiling::Profiler::printStats();
    return 0;
}

void DemoManager::handleEvents() {
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            running = false;
        } else if (event.type == sf::Event::KeyPressed) {
            switch (event.key.code) {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::R:
                    example.recenter();
                    break;
                default:
                    break;
            }
        } else if (event.type == sf::Event::MouseButtonPressed &&
                   event.mouseButton.button == sf::Mouse::Left) {
            example.handleTap(event.mouseButton.x, event.mouseButton.y);
        }
    }
}

void DemoManager::render(float fps) {
    PROFILE_SCOPE("DemoManager::render");

    renderer.clear();
    renderer.renderLayers(compositor.getRegistry());

    sf::Color const textColor(60, 60, 60);
    renderer.renderText(SpringExample::title(), 10, 10, textColor, 20);
    renderer.renderText(SpringExample::instructions(), 10, 36, textColor, 14);

    auto& spring = example.spring();
    std::string status = std::string("State: ") + Motion::toString(spring.state().value()) +
                         "  (" + std::to_string(spring.activeAnimationCount()) + " running)";
    renderer.renderText(status, 10, renderer.getHeight() - 28, textColor, 14);

    renderer.renderFPS(fps);
    renderer.present();
}
