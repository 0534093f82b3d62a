/**
 * @file compositor_host.hpp
 * @brief Owns the layer registry and the systems that animate it.
 */

#pragma once

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "motion/animation/key_path.hpp"
#include "motion/components/layer.hpp"
#include "motion/core/system_config.hpp"
#include "motion/math/vector_math.hpp"
#include "motion/systems/i_system.hpp"

/**
 * @class CompositorHost
 * @brief Software compositor: layers live in an ECS registry and are
 *        advanced one fixed tick at a time.
 */
class CompositorHost {
public:
    CompositorHost();
    explicit CompositorHost(const SystemConfig& config);
    ~CompositorHost();

    CompositorHost(const CompositorHost&) = delete;
    CompositorHost& operator=(const CompositorHost&) = delete;

    /**
     * @brief Creates a square layer whose position can be animated
     * @param position Initial center, in pixels
     * @param halfSize Half side length, in pixels
     * @param color Fill color
     */
    entt::entity createLayer(const Position& position,
                             double halfSize,
                             Components::Color color = Components::Color());

    /**
     * @brief Animatable position property of a layer
     */
    std::shared_ptr<Animation::KeyPath<Position>> positionKeyPath(entt::entity layer);

    /**
     * @brief Advances every system by one tick
     */
    void tick();

    /**
     * @brief Removes all layers and running animations. Pending completions
     *        are dropped.
     *
     * A spring bound to a removed layer never hears back and stays Active
     * until it is stopped or disabled; callers resetting the compositor
     * should stop such springs first.
     */
    void reset();

    void applyConfig(const SystemConfig& config);
    const SystemConfig& getConfig() const { return currentConfig; }

    /**
     * @brief Multiplier applied on top of the configured time step
     */
    void setTimeScale(double multiplier);

    /** @brief Compositor time elapsed since construction or reset, in seconds */
    double elapsedSeconds() const;

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    void createSystems();
    void createClock(double timeScale);
    Components::CompositorClock& clock();

    entt::registry registry;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    SystemConfig currentConfig;
};
