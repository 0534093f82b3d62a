/**
 * @file spring_example.cpp
 * @brief Implementation of the tap-to-move spring demo.
 */

#include "motion/demo/spring_example.hpp"

#include <algorithm>

#include "motion/core/constants.hpp"
#include "motion/core/debug.hpp"

SpringExample::SpringExample(CompositorHost& host, double width, double height, unsigned int seed)
    : width(width)
    , height(height)
    , squareLayer(entt::null)
    , rng(seed)
{
    squareLayer = host.createLayer(viewCenter(),
                                   MotionConstants::ExampleViewHalfSize,
                                   Components::Color(0x21, 0x96, 0xf3));
    positionPath = host.positionKeyPath(squareLayer);

    positionSpring = std::make_unique<Interactions::Spring<Position>>(positionPath);
    positionSpring->setFriction(positionSpring->friction() / 2);
    positionSpring->enable();

    aggregate.observe(*positionSpring);
}

SpringExample::~SpringExample() {
    aggregate.forgetAll();
}

void SpringExample::handleTap(double /*x*/, double /*y*/) {
    // Integer pixel coordinates in [0, width) x [0, height)
    int const maxX = std::max(0, static_cast<int>(width) - 1);
    int const maxY = std::max(0, static_cast<int>(height) - 1);
    std::uniform_int_distribution<int> distX(0, maxX);
    std::uniform_int_distribution<int> distY(0, maxY);

    Position const destination(distX(rng), distY(rng));
    MOTION_DEBUG(DEBUG_LEVEL_BASIC, "SpringExample: tap -> " << destination << "\n");

    positionSpring->setDestination(destination);
}

void SpringExample::recenter() {
    positionSpring->stop();
    positionSpring->clearDestination();
    positionPath->setValue(viewCenter());
    positionSpring->start();
}

const char* SpringExample::title() {
    return "Spring";
}

const char* SpringExample::instructions() {
    return "Tap anywhere to move the view.";
}

Position SpringExample::viewCenter() const {
    return {width / 2.0, height / 2.0};
}
