/**
 * @file narrowphase.hpp
 * @brief Exact overlap tests for broadphase candidate pairs
 *
 * The detector runs SAT or GJK/EPA per pair. Circle pairs always take the
 * closed-form path. Fallback conditions route chosen shape-type pairs to the
 * other algorithm.
 */

#ifndef COLLIDE2D_NARROWPHASE_HPP
#define COLLIDE2D_NARROWPHASE_HPP

#include <utility>
#include <vector>
#include <entt/entt.hpp>

#include "collide2d/algo/collision_results.hpp"
#include "collide2d/core/settings.hpp"
#include "collide2d/geometry/shape.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"
#include "collide2d/systems/rigid_body_collision/manifold_solver.hpp"

namespace RigidBodyCollision {

class NarrowphaseDetector {
public:
    explicit NarrowphaseDetector(NarrowphaseAlgorithm primary = NarrowphaseAlgorithm::Sat);

    /**
     * @brief Sends pairs of these shape types (either order) to the non-primary algorithm
     */
    void addFallbackCondition(Geometry::ShapeType a, Geometry::ShapeType b);

    void setPrimary(NarrowphaseAlgorithm algorithm) { primary = algorithm; }
    NarrowphaseAlgorithm getPrimary() const { return primary; }

    /** @brief Algorithm that will handle this shape pair */
    NarrowphaseAlgorithm select(const Geometry::Shape& a, const Geometry::Shape& b) const;

    /**
     * @brief Overlap test with penetration
     * @throws std::invalid_argument if either shape is null
     */
    bool detect(const Geometry::Shape* a, const Transform& ta,
                const Geometry::Shape* b, const Transform& tb,
                Penetration& penetration) const;

    /** @brief Boolean overlap test */
    bool detect(const Geometry::Shape* a, const Transform& ta,
                const Geometry::Shape* b, const Transform& tb) const;

private:
    NarrowphaseAlgorithm primary;
    std::vector<std::pair<Geometry::ShapeType, Geometry::ShapeType>> fallbackConditions;
};

/**
 * @brief Runs detection and manifold generation for each candidate pair
 *
 * Each pair is reordered so that the lower FixtureKey is shape A, which keeps
 * contact normals stable from step to step.
 *
 * @return one Collision per touching pair with a non-empty manifold
 */
std::vector<Collision> narrowPhase(const entt::registry& registry,
                                   const std::vector<BroadphasePair>& pairs,
                                   const NarrowphaseDetector& detector,
                                   const ClippingManifoldSolver& manifoldSolver);

} // namespace RigidBodyCollision

#endif // COLLIDE2D_NARROWPHASE_HPP
