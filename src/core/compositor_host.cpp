/**
 * @file compositor_host.cpp
 * @brief Implementation of CompositorHost.
 */

#include "motion/core/compositor_host.hpp"

#include "motion/core/constants.hpp"
#include "motion/core/debug.hpp"
#include "motion/core/profile.hpp"
#include "motion/systems/compositor.hpp"

CompositorHost::CompositorHost()
    : CompositorHost(SystemConfig{MotionConstants::secondsPerTick(), 1.0})
{
}

CompositorHost::CompositorHost(const SystemConfig& config)
    : currentConfig(config)
{
    createClock(1.0);
    createSystems();
}

CompositorHost::~CompositorHost() = default;

void CompositorHost::createSystems() {
    systems.clear();

    systems.push_back(std::make_unique<Systems::CompositorSystem<Position>>());
    systems.push_back(std::make_unique<Systems::CompositorSystem<double>>());

    for (auto& system : systems) {
        system->setSystemConfig(currentConfig);
    }
}

void CompositorHost::createClock(double timeScale) {
    auto clockEntity = registry.create();
    registry.emplace<Components::CompositorClock>(clockEntity, timeScale);
}

Components::CompositorClock& CompositorHost::clock() {
    auto view = registry.view<Components::CompositorClock>();
    return registry.get<Components::CompositorClock>(view.front());
}

entt::entity CompositorHost::createLayer(const Position& position,
                                         double halfSize,
                                         Components::Color color) {
    auto layer = registry.create();
    registry.emplace<Components::ModelValue<Position>>(layer, position);
    registry.emplace<Components::PresentationValue<Position>>(layer, position);
    registry.emplace<Components::AnimationTrack<Position>>(layer);
    registry.emplace<Components::Shape>(layer, halfSize);
    registry.emplace<Components::Color>(layer, color);

    MOTION_DEBUG(DEBUG_LEVEL_BASIC, "CompositorHost: created layer at " << position << "\n");
    return layer;
}

std::shared_ptr<Animation::KeyPath<Position>> CompositorHost::positionKeyPath(entt::entity layer) {
    return std::make_shared<Animation::KeyPath<Position>>(registry, layer);
}

void CompositorHost::tick() {
    PROFILE_SCOPE("CompositorHost::tick");

    auto& c = clock();
    c.elapsedSeconds += currentConfig.SecondsPerTick * currentConfig.TimeScale * c.timeScale;

    for (auto& system : systems) {
        system->update(registry);
    }
    MotionStats::recordTick();
}

void CompositorHost::reset() {
    double const timeScale = clock().timeScale;

    registry.clear();
    createClock(timeScale);
}

void CompositorHost::applyConfig(const SystemConfig& config) {
    currentConfig = config;

    for (auto& system : systems) {
        system->setSystemConfig(currentConfig);
    }
}

void CompositorHost::setTimeScale(double multiplier) {
    clock().timeScale = multiplier;
}

double CompositorHost::elapsedSeconds() const {
    auto view = registry.view<Components::CompositorClock>();
    if (view.empty()) {
        return 0.0;
    }
    return registry.get<Components::CompositorClock>(view.front()).elapsedSeconds;
}
