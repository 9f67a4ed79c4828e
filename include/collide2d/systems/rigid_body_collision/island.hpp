/**
 * @file island.hpp
 * @brief Partition of bodies into independently solvable groups
 */

#ifndef COLLIDE2D_ISLAND_HPP
#define COLLIDE2D_ISLAND_HPP

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "collide2d/systems/rigid_body_collision/contact_constraint.hpp"

namespace RigidBodyCollision {

/**
 * @struct Island
 * @brief Bodies connected through solvable contacts
 *
 * Static bodies appear in every island that touches them but never join two
 * islands together. Rebuilt every step.
 */
struct Island {
    std::vector<entt::entity> bodies;
    std::vector<std::size_t> constraints;  ///< indices into the constraint list
};

/**
 * @brief Groups bodies by contact connectivity
 *
 * Only non-sensor constraints with at least one enabled contact are edges.
 * Every dynamic body in seeds ends up in exactly one island, so isolated
 * bodies form single-body islands.
 *
 * @param registry Body storage, used to classify bodies as static
 * @param seeds Bodies to cover, typically every dynamic body
 * @param constraints The step's contact constraints
 */
std::vector<Island> buildIslands(const entt::registry& registry,
                                 const std::vector<entt::entity>& seeds,
                                 const std::vector<ContactConstraint>& constraints);

} // namespace RigidBodyCollision

#endif
