/**
 * @file manifold_solver.hpp
 * @brief Contact point generation by reference/incident edge clipping
 */

#ifndef COLLIDE2D_MANIFOLD_SOLVER_HPP
#define COLLIDE2D_MANIFOLD_SOLVER_HPP

#include <vector>

#include "collide2d/algo/collision_results.hpp"
#include "collide2d/geometry/shape.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @class ClippingManifoldSolver
 * @brief Turns a penetration normal into at most two contact points
 *
 * If either shape's farthest feature is a vertex the manifold is that single
 * point. Otherwise the edge least aligned with the normal is the reference
 * edge; the other (incident) edge is clipped against the reference edge's two
 * side planes and points behind the reference face are kept.
 */
class ClippingManifoldSolver {
public:
    /**
     * @param penetration Normal (A toward B) and depth from the narrowphase
     * @param manifold Output; normal always points from A toward B
     * @return false when clipping leaves no valid point
     */
    bool getManifold(const Penetration& penetration,
                     const Geometry::Shape& a, const Transform& ta,
                     const Geometry::Shape& b, const Transform& tb,
                     Manifold& manifold) const;

private:
    /** @brief Keeps the part of segment v1-v2 with n.p <= offset */
    static std::vector<Geometry::Vertex> clip(const Geometry::Vertex& v1, const Geometry::Vertex& v2,
                                              const Vector& n, double offset);
};

} // namespace RigidBodyCollision

#endif
