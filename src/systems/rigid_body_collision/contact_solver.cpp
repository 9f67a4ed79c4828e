/**
 * @file contact_solver.cpp
 * @brief Sequential impulse solver with warm starting and a two-point block solver
 *
 * Per island:
 * - initialize: load bodies, compute offsets, effective masses and bias
 * - warmStart: reapply last step's accumulated impulses
 * - solveVelocityConstraints: normal rows (block LCP for two points), then friction
 * - integratePositions: x += v dt with translation/rotation clamps
 * - solvePositionConstraints: Baumgarte pseudo impulses until separation is acceptable
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

#include "collide2d/systems/rigid_body_collision/contact_solver.hpp"
#include "collide2d/systems/rigid_body_collision/body_access.hpp"
#include "collide2d/components/basic.hpp"
#include "collide2d/core/profile.hpp"

namespace RigidBodyCollision
{

#if !defined(ENABLE_CONTACT_SOLVER_DEBUG)
    #define ENABLE_CONTACT_SOLVER_DEBUG 0
#endif

#define DEBUG_LOG(x) \
    do { if (ENABLE_CONTACT_SOLVER_DEBUG) { std::cout << x << std::endl; } } while(0)

// Above this condition number the 2x2 normal block is solved point by point
static constexpr double MAX_CONDITION_NUMBER = 1000.0;

/**
 * @brief Velocity of a body at offset r from its center
 */
static Vector pointVelocity(const SolverBody &b, const Vector &r)
{
    return b.velocity + cross(b.angularVelocity, r);
}

/**
 * @brief Applies equal and opposite impulses: -J to body 1 at r1, +J to body 2 at r2
 */
static void applyImpulse(SolverBody &b1, SolverBody &b2,
                         const Vector &J, const Vector &r1, const Vector &r2)
{
    b1.velocity -= J * b1.invMass;
    b1.angularVelocity -= b1.invInertia * r1.cross(J);
    b2.velocity += J * b2.invMass;
    b2.angularVelocity += b2.invInertia * r2.cross(J);
}

/**
 * @brief Inverse effective mass along a direction for one contact
 */
static double inverseEffectiveMass(const SolverBody &b1, const SolverBody &b2,
                                   const Vector &r1, const Vector &r2, const Vector &dir)
{
    double const rn1 = r1.cross(dir);
    double const rn2 = r2.cross(dir);
    return b1.invMass + b2.invMass
         + b1.invInertia * rn1 * rn1
         + b2.invInertia * rn2 * rn2;
}

//------------------------------------------------------------------------------
// Setup
//------------------------------------------------------------------------------

void ContactSolver::initialize(const entt::registry &registry, const Island &island,
                               std::vector<ContactConstraint> &constraints, const Settings &settings)
{
    m_settings = settings;
    m_bodies.clear();
    m_constraints.clear();
    m_bodyIndices.clear();

    // Load bodies from ECS
    std::unordered_map<entt::entity, int> indexMap;
    m_bodies.reserve(island.bodies.size());
    for (entt::entity e : island.bodies) {
        SolverBody sb;
        sb.entity = e;
        sb.transform = getTransform(registry, e);
        if (const auto *vel = registry.try_get<Components::Velocity>(e)) {
            sb.velocity = *vel;
        }
        if (const auto *ang = registry.try_get<Components::AngularVelocity>(e)) {
            sb.angularVelocity = ang->omega;
        }
        sb.dynamic = !isStatic(registry, e);
        sb.invMass = getInverseMass(registry, e);
        sb.invInertia = getInverseInertia(registry, e);

        indexMap.emplace(e, static_cast<int>(m_bodies.size()));
        m_bodies.push_back(sb);
    }

    m_constraints.reserve(island.constraints.size());
    m_bodyIndices.reserve(island.constraints.size());
    for (std::size_t idx : island.constraints) {
        ContactConstraint &cc = constraints[idx];
        auto it1 = indexMap.find(cc.getBody1());
        auto it2 = indexMap.find(cc.getBody2());
        if (it1 == indexMap.end() || it2 == indexMap.end()) {
            continue;
        }
        m_constraints.push_back(&cc);
        m_bodyIndices.emplace_back(it1->second, it2->second);
    }

    // Precompute per-contact solver terms
    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        ContactConstraint &cc = *m_constraints[i];
        SolverBody &b1 = m_bodies[m_bodyIndices[i].first];
        SolverBody &b2 = m_bodies[m_bodyIndices[i].second];

        const Vector c1 = b1.transform.getTranslation();
        const Vector c2 = b2.transform.getTranslation();
        const Vector &n = cc.normal;
        cc.tangent = n.rightPerp();

        for (auto &c : cc.contacts) {
            c.r1 = c.p - c1;
            c.r2 = c.p - c2;

            double const kN = inverseEffectiveMass(b1, b2, c.r1, c.r2, n);
            double const kT = inverseEffectiveMass(b1, b2, c.r1, c.r2, cc.tangent);
            c.massN = kN > EPSILON ? 1.0 / kN : 0.0;
            c.massT = kT > EPSILON ? 1.0 / kT : 0.0;

            // bounce only on fast approach
            double const rvn = n.dotProduct(pointVelocity(b2, c.r2) - pointVelocity(b1, c.r1));
            c.vb = rvn < -m_settings.RestitutionVelocity ? -cc.restitution * rvn : 0.0;
        }

        cc.blockSolve = false;
        if (m_settings.BlockSolverEnabled && cc.contacts.size() == 2) {
            const Contact &ca = cc.contacts[0];
            const Contact &cb = cc.contacts[1];
            double const rn1a = ca.r1.cross(n);
            double const rn1b = cb.r1.cross(n);
            double const rn2a = ca.r2.cross(n);
            double const rn2b = cb.r2.cross(n);

            double const k11 = inverseEffectiveMass(b1, b2, ca.r1, ca.r2, n);
            double const k22 = inverseEffectiveMass(b1, b2, cb.r1, cb.r2, n);
            double const k12 = b1.invMass + b2.invMass
                             + b1.invInertia * rn1a * rn1b
                             + b2.invInertia * rn2a * rn2b;

            if (k11 * k11 < MAX_CONDITION_NUMBER * (k11 * k22 - k12 * k12)) {
                cc.K = Matrix22(k11, k12, k12, k22);
                cc.invK = cc.K.inverse();
                cc.blockSolve = true;
            }
        }
    }

    DEBUG_LOG("[ContactSolver] island: " << m_bodies.size() << " bodies, "
              << m_constraints.size() << " constraints");
}

void ContactSolver::warmStart()
{
    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        ContactConstraint &cc = *m_constraints[i];
        SolverBody &b1 = m_bodies[m_bodyIndices[i].first];
        SolverBody &b2 = m_bodies[m_bodyIndices[i].second];

        for (auto &c : cc.contacts) {
            if (!m_settings.WarmStartingEnabled) {
                c.jn = 0.0;
                c.jt = 0.0;
                continue;
            }
            if (!c.enabled) {
                continue;
            }
            Vector const J = cc.normal * c.jn + cc.tangent * c.jt;
            applyImpulse(b1, b2, J, c.r1, c.r2);
        }
    }
}

//------------------------------------------------------------------------------
// Velocity phase
//------------------------------------------------------------------------------

void ContactSolver::solveNormal(ContactConstraint &cc, SolverBody &b1, SolverBody &b2)
{
    for (auto &c : cc.contacts) {
        if (!c.enabled) {
            continue;
        }
        double const rvn = cc.normal.dotProduct(pointVelocity(b2, c.r2) - pointVelocity(b1, c.r1));
        double j = -c.massN * (rvn - c.vb);

        // accumulated impulse stays non-negative
        double const jOld = c.jn;
        c.jn = std::max(jOld + j, 0.0);
        j = c.jn - jOld;

        applyImpulse(b1, b2, cc.normal * j, c.r1, c.r2);
    }
}

/**
 * @brief Solves both normal rows together as a 2D mixed LCP
 *
 * Tries the four complementarity cases in turn: both points active, only
 * the first, only the second, neither. The first case whose impulses are
 * non-negative and whose resulting velocities are non-negative is applied.
 */
void ContactSolver::solveNormalBlock(ContactConstraint &cc, SolverBody &b1, SolverBody &b2)
{
    Contact &ca = cc.contacts[0];
    Contact &cb = cc.contacts[1];
    const Vector &n = cc.normal;

    Vector const a(ca.jn, cb.jn);

    double const vn1 = n.dotProduct(pointVelocity(b2, ca.r2) - pointVelocity(b1, ca.r1));
    double const vn2 = n.dotProduct(pointVelocity(b2, cb.r2) - pointVelocity(b1, cb.r1));

    Vector b(vn1 - ca.vb, vn2 - cb.vb);
    b -= cc.K.product(a);

    auto apply = [&](const Vector &x) {
        Vector const d = x - a;
        Vector const P1 = n * d.x;
        Vector const P2 = n * d.y;

        b1.velocity -= (P1 + P2) * b1.invMass;
        b1.angularVelocity -= b1.invInertia * (ca.r1.cross(P1) + cb.r1.cross(P2));
        b2.velocity += (P1 + P2) * b2.invMass;
        b2.angularVelocity += b2.invInertia * (ca.r2.cross(P1) + cb.r2.cross(P2));

        ca.jn = x.x;
        cb.jn = x.y;
    };

    // Case 1: both active, vn = 0
    Vector x = -cc.invK.product(b);
    if (x.x >= 0.0 && x.y >= 0.0) {
        apply(x);
        return;
    }

    // Case 2: first active, second separating
    x = Vector(-ca.massN * b.x, 0.0);
    double v2 = cc.K.m10 * x.x + b.y;
    if (x.x >= 0.0 && v2 >= 0.0) {
        apply(x);
        return;
    }

    // Case 3: second active, first separating
    x = Vector(0.0, -cb.massN * b.y);
    double v1 = cc.K.m01 * x.y + b.x;
    if (x.y >= 0.0 && v1 >= 0.0) {
        apply(x);
        return;
    }

    // Case 4: both separating
    x = Vector(0.0, 0.0);
    v1 = b.x;
    v2 = b.y;
    if (v1 >= 0.0 && v2 >= 0.0) {
        apply(x);
        return;
    }

    // No case satisfied, usually a numerical corner; keep last impulses
    DEBUG_LOG("[ContactSolver] block solver found no solution");
}

void ContactSolver::solveTangent(ContactConstraint &cc, SolverBody &b1, SolverBody &b2)
{
    for (auto &c : cc.contacts) {
        if (!c.enabled) {
            continue;
        }
        double const rvt = cc.tangent.dotProduct(pointVelocity(b2, c.r2) - pointVelocity(b1, c.r1));
        double j = -c.massT * rvt;

        // Coulomb cone
        double const maxJ = cc.friction * c.jn;
        double const jOld = c.jt;
        c.jt = std::clamp(jOld + j, -maxJ, maxJ);
        j = c.jt - jOld;

        applyImpulse(b1, b2, cc.tangent * j, c.r1, c.r2);
    }
}

void ContactSolver::solveVelocityConstraints()
{
    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        ContactConstraint &cc = *m_constraints[i];
        SolverBody &b1 = m_bodies[m_bodyIndices[i].first];
        SolverBody &b2 = m_bodies[m_bodyIndices[i].second];

        bool const allEnabled = std::all_of(cc.contacts.begin(), cc.contacts.end(),
                                            [](const Contact &c) { return c.enabled; });
        if (cc.blockSolve && allEnabled) {
            solveNormalBlock(cc, b1, b2);
        } else {
            solveNormal(cc, b1, b2);
        }
        solveTangent(cc, b1, b2);
    }
}

//------------------------------------------------------------------------------
// Integration
//------------------------------------------------------------------------------

void ContactSolver::integratePositions()
{
    double const dt = m_settings.StepFrequency;
    double const maxTranslationSq = m_settings.MaxTranslation * m_settings.MaxTranslation;

    for (auto &b : m_bodies) {
        if (!b.dynamic) {
            continue;
        }

        Vector translation = b.velocity * dt;
        if (translation.lengthSquared() > maxTranslationSq) {
            double const ratio = m_settings.MaxTranslation / translation.length();
            b.velocity *= ratio;
            translation = b.velocity * dt;
        }

        double rotation = b.angularVelocity * dt;
        if (std::fabs(rotation) > m_settings.MaxRotation) {
            double const ratio = m_settings.MaxRotation / std::fabs(rotation);
            b.angularVelocity *= ratio;
            rotation = b.angularVelocity * dt;
        }

        b.transform.translate(translation);
        b.transform.setAngle(b.transform.getAngle() + rotation);
    }
}

//------------------------------------------------------------------------------
// Position phase
//------------------------------------------------------------------------------

bool ContactSolver::solvePositionConstraints()
{
    double const linearTolerance = m_settings.LinearTolerance;
    double const maxCorrection = m_settings.MaxLinearCorrection;
    double const maxAngularCorrection = m_settings.MaxAngularCorrection;
    double const baumgarte = m_settings.Baumgarte;

    double minSeparation = 0.0;

    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        ContactConstraint &cc = *m_constraints[i];
        SolverBody &b1 = m_bodies[m_bodyIndices[i].first];
        SolverBody &b2 = m_bodies[m_bodyIndices[i].second];
        const Vector &n = cc.normal;

        for (const auto &c : cc.contacts) {
            if (!c.enabled) {
                continue;
            }

            // anchors follow their bodies
            Vector const pw1 = b1.transform.apply(c.p1);
            Vector const pw2 = b2.transform.apply(c.p2);
            Vector const r1 = pw1 - b1.transform.getTranslation();
            Vector const r2 = pw2 - b2.transform.getTranslation();

            double const separation = (pw2 - pw1).dotProduct(n) - c.depth;
            minSeparation = std::min(minSeparation, separation);

            double const C = std::clamp(baumgarte * (separation + linearTolerance), -maxCorrection, 0.0);

            double const K = inverseEffectiveMass(b1, b2, r1, r2, n);
            double const impulse = K > 0.0 ? -C / K : 0.0;
            Vector const J = n * impulse;

            double const da1 = std::clamp(-b1.invInertia * r1.cross(J), -maxAngularCorrection, maxAngularCorrection);
            double const da2 = std::clamp(b2.invInertia * r2.cross(J), -maxAngularCorrection, maxAngularCorrection);

            b1.transform.translate(-(J * b1.invMass));
            b1.transform.setAngle(b1.transform.getAngle() + da1);
            b2.transform.translate(J * b2.invMass);
            b2.transform.setAngle(b2.transform.getAngle() + da2);
        }
    }

    return minSeparation >= -3.0 * linearTolerance;
}

//------------------------------------------------------------------------------
// Write back
//------------------------------------------------------------------------------

void ContactSolver::store(entt::registry &registry) const
{
    for (const auto &b : m_bodies) {
        if (!b.dynamic || !registry.valid(b.entity)) {
            continue;
        }
        setTransform(registry, b.entity, b.transform);
        registry.emplace_or_replace<Components::Velocity>(b.entity, b.velocity);
        if (registry.all_of<Components::AngularVelocity>(b.entity) || b.angularVelocity != 0.0) {
            registry.emplace_or_replace<Components::AngularVelocity>(
                b.entity, Components::AngularVelocity{b.angularVelocity});
        }
    }
}

void ContactSolver::solve(entt::registry &registry, const Island &island,
                          std::vector<ContactConstraint> &constraints, const Settings &settings)
{
    PROFILE_SCOPE("ContactSolver");

    initialize(registry, island, constraints, settings);
    warmStart();

    for (int i = 0; i < settings.VelocityIterations; ++i) {
        solveVelocityConstraints();
    }

    integratePositions();

    for (int i = 0; i < settings.PositionIterations; ++i) {
        if (solvePositionConstraints()) {
            DEBUG_LOG("[ContactSolver] position solve converged after " << (i + 1) << " iterations");
            break;
        }
    }

    store(registry);
}

} // namespace RigidBodyCollision
