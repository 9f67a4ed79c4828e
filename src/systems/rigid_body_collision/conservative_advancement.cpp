#include "collide2d/systems/rigid_body_collision/conservative_advancement.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "collide2d/algo/gjk.hpp"

#define ENABLE_TOI_DEBUG 0
#define DEBUG(x) do { if (ENABLE_TOI_DEBUG) { std::cout << "[DEBUG TOI] " << x << std::endl; } } while(0)

namespace RigidBodyCollision {

bool ConservativeAdvancement::solve(const Geometry::Shape* shapeA, const Transform& txA, const Vector& dpA, double daA,
                                    const Geometry::Shape* shapeB, const Transform& txB, const Vector& dpB, double daB,
                                    double t1, double t2, TimeOfImpact& toi) const
{
    if (!shapeA || !shapeB) {
        throw std::invalid_argument("ConservativeAdvancement::solve: null shape");
    }

    Transform lerpA = txA.lerp(dpA, daA, t1);
    Transform lerpB = txB.lerp(dpB, daB, t1);

    Separation separation;
    if (!GJKDistance(shapeA, lerpA, shapeB, lerpB, separation)) {
        // already overlapping, the discrete solver owns this pair
        return false;
    }

    double d = separation.distance;
    if (d < distanceEpsilon) {
        toi.time = t1;
        toi.separation = separation;
        return true;
    }

    Vector const rv = dpA - dpB;
    double const amax = shapeA->getRadius() * std::fabs(daA) + shapeB->getRadius() * std::fabs(daB);
    if (rv.isZero() && amax <= 0.0) {
        return false;
    }

    Vector n = separation.normal;
    double l = t1;
    double l0 = l;
    bool hit = false;

    for (int iteration = 0; iteration < maxIterations; ++iteration) {
        double const drel = rv.dotProduct(n) + amax;
        if (drel <= EPSILON) {
            // separating or sliding past
            return false;
        }

        l += d / drel;
        if (l < t1 || l > t2) {
            return false;
        }
        if (l <= l0) {
            hit = true;
            break;
        }
        l0 = l;

        lerpA = txA.lerp(dpA, daA, l);
        lerpB = txB.lerp(dpB, daB, l);

        if (GJKDistance(shapeA, lerpA, shapeB, lerpB, separation)) {
            d = separation.distance;
            n = separation.normal;
            if (d < distanceEpsilon) {
                hit = true;
                break;
            }
            continue;
        }

        // overshot into penetration: back off once and take that as the hit
        l -= 0.5 * distanceEpsilon / drel;
        lerpA = txA.lerp(dpA, daA, l);
        lerpB = txB.lerp(dpB, daB, l);
        if (!GJKDistance(shapeA, lerpA, shapeB, lerpB, separation)) {
            DEBUG("still overlapping after back-off at t=" << l);
            return false;
        }
        hit = true;
        break;
    }

    if (!hit) {
        DEBUG("no convergence within " << maxIterations << " iterations");
        return false;
    }

    toi.time = l;
    toi.separation = separation;
    DEBUG("impact at t=" << l << " gap=" << separation.distance);
    return true;
}

} // namespace RigidBodyCollision
