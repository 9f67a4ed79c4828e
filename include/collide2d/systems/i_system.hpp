/**
 * @file i_system.hpp
 * @brief Interface for ECS systems driven once per step
 */

#pragma once

#include <entt/entt.hpp>
#include "collide2d/core/settings.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Systems share a common way to be stepped and configured. Settings are
 * read-only during a step.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Replaces the system settings
     *
     * @param settings New parameters
     * @throws std::invalid_argument if the settings fail validation
     */
    virtual void setSettings(const Settings& settings) = 0;
};

} // namespace Systems
