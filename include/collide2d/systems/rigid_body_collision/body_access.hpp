/**
 * @file body_access.hpp
 * @brief Reads and writes the body state the collision stages need
 *
 * Bodies are plain entities. Missing optional components fall back to
 * defaults: no AngularPosition means angle 0, no Mass means static.
 */

#ifndef COLLIDE2D_BODY_ACCESS_HPP
#define COLLIDE2D_BODY_ACCESS_HPP

#include <entt/entt.hpp>

#include "collide2d/components/basic.hpp"
#include "collide2d/math/transform.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

Transform getTransform(const entt::registry& registry, entt::entity body);

void setTransform(entt::registry& registry, entt::entity body, const Transform& transform);

/** @brief True for bodies that never move (Boundary tag or infinite/absent mass) */
bool isStatic(const entt::registry& registry, entt::entity body);

/** @brief 0 for static bodies */
double getInverseMass(const entt::registry& registry, entt::entity body);

/** @brief 0 for static bodies and bodies with no finite inertia */
double getInverseInertia(const entt::registry& registry, entt::entity body);

/**
 * @brief Looks up a fixture by key
 * @return nullptr when the body has no Collider or the index is out of range
 */
const Components::Fixture* getFixture(const entt::registry& registry, const FixtureKey& key);

} // namespace RigidBodyCollision

#endif
