/**
 * @file conservative_advancement.hpp
 * @brief Time of impact between two moving convex shapes
 *
 * Conservative advancement steps the two shapes toward each other along their
 * swept motion. Each step advances by the current gap divided by an upper
 * bound on the approach speed, so the shapes can never pass through each
 * other between samples.
 */

#ifndef COLLIDE2D_CONSERVATIVE_ADVANCEMENT_HPP
#define COLLIDE2D_CONSERVATIVE_ADVANCEMENT_HPP

#include <cmath>

#include "collide2d/algo/collision_results.hpp"
#include "collide2d/geometry/shape.hpp"
#include "collide2d/math/transform.hpp"

namespace RigidBodyCollision {

/** First touching time in [0, 1] of the step and the gap at that time */
struct TimeOfImpact {
    double time = 0.0;
    Separation separation;
};

class ConservativeAdvancement {
public:
    static constexpr int DEFAULT_MAX_ITERATIONS = 30;

    ConservativeAdvancement()
        : distanceEpsilon(std::sqrt(EPSILON)),
          maxIterations(DEFAULT_MAX_ITERATIONS) {}

    /**
     * @brief Finds when two swept shapes first come within distanceEpsilon
     *
     * Transforms are the poses at the start of the step; dp and da are the
     * whole-step linear and angular displacements.
     *
     * @param t1 Start of the searched interval
     * @param t2 End of the searched interval
     * @return false when the shapes overlap at t1, never approach, or do not
     *         meet within [t1, t2] and the iteration budget
     * @throws std::invalid_argument if either shape is null
     */
    bool solve(const Geometry::Shape* shapeA, const Transform& txA, const Vector& dpA, double daA,
               const Geometry::Shape* shapeB, const Transform& txB, const Vector& dpB, double daB,
               double t1, double t2, TimeOfImpact& toi) const;

    double getDistanceEpsilon() const { return distanceEpsilon; }
    void setDistanceEpsilon(double epsilon) { distanceEpsilon = epsilon; }

    int getMaxIterations() const { return maxIterations; }
    void setMaxIterations(int iterations) { maxIterations = iterations; }

private:
    double distanceEpsilon;
    int maxIterations;
};

} // namespace RigidBodyCollision

#endif
