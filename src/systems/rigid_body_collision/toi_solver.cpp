/**
 * @file toi_solver.cpp
 * @brief Position nudge for a pair stopped at its time of impact
 *
 * After continuous collision moves a fast body back to its first contact,
 * the pair is separated by less than the linear tolerance. A single
 * pseudo-impulse along the separation normal restores that gap.
 */

#include <algorithm>
#include <iostream>

#include "collide2d/systems/rigid_body_collision/toi_solver.hpp"
#include "collide2d/systems/rigid_body_collision/body_access.hpp"
#include "collide2d/core/profile.hpp"

#define ENABLE_TOI_SOLVER_DEBUG 0

namespace RigidBodyCollision {

namespace {

/**
 * @brief Per-body data for the nudge
 */
struct BodyData {
    entt::entity e;
    bool dynamic;
    double invMass;
    double invI;
    Transform transform;
};

BodyData loadBodyData(const entt::registry &registry, entt::entity e)
{
    BodyData bd;
    bd.e = e;
    bd.dynamic = !isStatic(registry, e);
    bd.invMass = getInverseMass(registry, e);
    bd.invI = getInverseInertia(registry, e);
    bd.transform = getTransform(registry, e);
    return bd;
}

} // namespace

void TimeOfImpactSolver::solve(entt::registry &registry,
                               entt::entity body1,
                               entt::entity body2,
                               const TimeOfImpact &toi,
                               const Settings &settings)
{
    PROFILE_SCOPE("TimeOfImpactSolver");

    if (!registry.valid(body1) || !registry.valid(body2)) {
        return;
    }

    BodyData A = loadBodyData(registry, body1);
    BodyData B = loadBodyData(registry, body2);
    if (!A.dynamic && !B.dynamic) {
        return;
    }

    const Separation &sep = toi.separation;
    const Vector &n = sep.normal;

    // only close the gap down to the tolerance, never open it further
    double const C = std::clamp(sep.distance - settings.LinearTolerance,
                                -settings.MaxLinearCorrection, 0.0);
    if (C >= 0.0) {
        return;
    }

    Vector const rA = sep.point1 - A.transform.getTranslation();
    Vector const rB = sep.point2 - B.transform.getTranslation();

    double const rnA = rA.cross(n);
    double const rnB = rB.cross(n);
    double const K = A.invMass + B.invMass
                   + A.invI * rnA * rnA
                   + B.invI * rnB * rnB;
    if (K <= EPSILON) {
        return;
    }

    double const impulse = -C / K;
    Vector const J = n * impulse;

    // Move A opposite the normal
    if (A.dynamic) {
        A.transform.translate(-(J * A.invMass));
        A.transform.setAngle(A.transform.getAngle() - A.invI * rA.cross(J));
        setTransform(registry, A.e, A.transform);
    }

    // Move B along the normal
    if (B.dynamic) {
        B.transform.translate(J * B.invMass);
        B.transform.setAngle(B.transform.getAngle() + B.invI * rB.cross(J));
        setTransform(registry, B.e, B.transform);
    }

    if (ENABLE_TOI_SOLVER_DEBUG) {
        std::cout << "[TimeOfImpactSolver] gap " << sep.distance << " corrected by " << -C << std::endl;
    }
}

} // namespace RigidBodyCollision
