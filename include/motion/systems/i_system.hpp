/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems run by the compositor
 */

#pragma once

#include <entt/entt.hpp>
#include "motion/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one compositor tick
     *
     * @param registry EnTT registry containing all layers
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) = 0;
};

} // namespace Systems
