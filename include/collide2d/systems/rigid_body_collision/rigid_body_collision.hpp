/**
 * @file rigid_body_collision.hpp
 * @brief Main collision detection and resolution system for rigid bodies
 *
 * This module orchestrates the complete collision pipeline:
 * 1. Broad-phase: dynamic AABB tree over every fixture
 * 2. Narrow-phase: SAT or GJK/EPA, then clipping for contact points
 * 3. Contact update: warm starting and listener notification
 * 4. Islands: independent groups of touching bodies
 * 5. Solve: sequential impulses per island, positions integrated in between
 * 6. Continuous collision: time of impact for fast bodies
 */

#ifndef COLLIDE2D_RIGID_BODY_COLLISION_SYSTEM_HPP
#define COLLIDE2D_RIGID_BODY_COLLISION_SYSTEM_HPP

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "collide2d/core/settings.hpp"
#include "collide2d/geometry/ray.hpp"
#include "collide2d/systems/i_system.hpp"
#include "collide2d/systems/rigid_body_collision/broadphase.hpp"
#include "collide2d/systems/rigid_body_collision/conservative_advancement.hpp"
#include "collide2d/systems/rigid_body_collision/contact_listener.hpp"
#include "collide2d/systems/rigid_body_collision/contact_manager.hpp"
#include "collide2d/systems/rigid_body_collision/island.hpp"
#include "collide2d/systems/rigid_body_collision/manifold_solver.hpp"
#include "collide2d/systems/rigid_body_collision/narrowphase.hpp"

namespace Systems {

/** Closest ray hit and the fixture it struck */
struct RaycastHit {
    RigidBodyCollision::FixtureKey fixture;
    RaycastResult result;
};

/**
 * @brief Main collision system coordinating detection and resolution
 *
 * Operates on every entity with a Components::Collider. Bodies are static
 * when tagged Components::Boundary or when their mass is absent, non-positive
 * or above Components::INFINITE_MASS_THRESHOLD. Dynamic bodies are advanced
 * by their velocity during the solve, so the caller integrates forces into
 * velocities before update() and nothing else.
 */
class RigidBodyCollisionSystem : public ISystem {
public:
    RigidBodyCollisionSystem();

    /** @throws std::invalid_argument if the settings fail validation */
    explicit RigidBodyCollisionSystem(const Settings& settings);

    /**
     * @brief Executes the complete collision pipeline for one step
     *
     * @param registry ECS registry containing physics components
     */
    void update(entt::registry& registry) override;

    void setSettings(const Settings& settings) override;
    const Settings& getSettings() const { return settings; }

    /** @brief Replaces the friction/restitution mixing policy; null restores the default */
    void setCoefficientMixer(std::shared_ptr<const RigidBodyCollision::CoefficientMixer> mixer);

    void addListener(std::shared_ptr<RigidBodyCollision::ContactListener> listener);
    bool removeListener(const std::shared_ptr<RigidBodyCollision::ContactListener>& listener);

    /**
     * @brief Closest fixture hit by a ray, as of the last update
     *
     * @param maxLength Maximum distance, <= 0 for unbounded
     * @param filter Optional fixture filter
     * @return false when nothing is hit
     */
    bool raycast(const entt::registry& registry, const Geometry::Ray& ray, double maxLength,
                 RaycastHit& hit,
                 const RigidBodyCollision::BroadphaseItemFilter& filter = nullptr) const;

    /** @brief Fixtures whose fattened AABB overlaps aabb */
    std::vector<RigidBodyCollision::FixtureKey> query(const AABB& aabb) const;

    /** @brief Islands solved during the last update */
    const std::vector<RigidBodyCollision::Island>& getIslands() const { return islands; }

    RigidBodyCollision::ContactManager& getContactManager() { return contactManager; }
    const RigidBodyCollision::ContactManager& getContactManager() const { return contactManager; }

    RigidBodyCollision::NarrowphaseDetector& getNarrowphaseDetector() { return detector; }
    const RigidBodyCollision::Broadphase& getBroadphase() const { return broadphase; }

    /** @brief Forgets every proxy, contact and island without notifying listeners */
    void reset();

private:
    void updateBroadphase(entt::registry& registry);
    bool allowPair(const entt::registry& registry,
                   const RigidBodyCollision::FixtureKey& a,
                   const RigidBodyCollision::FixtureKey& b) const;
    void buildConstraints(const entt::registry& registry,
                          const std::vector<RigidBodyCollision::Collision>& collisions);
    void solveTimeOfImpact(entt::registry& registry);

    Settings settings;
    RigidBodyCollision::Broadphase broadphase;
    RigidBodyCollision::NarrowphaseDetector detector;
    RigidBodyCollision::ClippingManifoldSolver manifoldSolver;
    RigidBodyCollision::ContactManager contactManager;
    RigidBodyCollision::ConservativeAdvancement advancement;
    std::shared_ptr<const RigidBodyCollision::CoefficientMixer> mixer;

    std::vector<RigidBodyCollision::Island> islands;
    std::unordered_map<entt::entity, std::size_t> registered;       ///< body -> fixture count in the broadphase
    std::unordered_map<entt::entity, Transform> initialTransforms;  ///< poses at the start of the step
};

} // namespace Systems

#endif // COLLIDE2D_RIGID_BODY_COLLISION_SYSTEM_HPP
