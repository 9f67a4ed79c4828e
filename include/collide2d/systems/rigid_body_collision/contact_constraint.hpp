/**
 * @file contact_constraint.hpp
 * @brief Solver-side representation of a touching fixture pair
 */

#ifndef COLLIDE2D_CONTACT_CONSTRAINT_HPP
#define COLLIDE2D_CONTACT_CONSTRAINT_HPP

#include <cstddef>
#include <vector>

#include "collide2d/math/matrix22.hpp"
#include "collide2d/math/transform.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief One contact point and its accumulated impulses
 *
 * jn and jt survive between steps through warm starting; the remaining solver
 * terms are recomputed every step.
 */
struct Contact {
    ManifoldPointId id;
    Vector p;              ///< world contact point
    double depth = 0.0;

    Vector p1;             ///< p in body 1 local space
    Vector p2;             ///< p in body 2 local space
    Vector r1;             ///< body 1 centre to p
    Vector r2;             ///< body 2 centre to p

    double jn = 0.0;       ///< accumulated normal impulse
    double jt = 0.0;       ///< accumulated tangent impulse

    double massN = 0.0;
    double massT = 0.0;
    double vb = 0.0;       ///< restitution velocity bias

    bool enabled = true;   ///< false when a listener vetoed this point
};

struct ContactConstraintId {
    FixtureKey fixture1;
    FixtureKey fixture2;

    bool operator==(const ContactConstraintId& o) const {
        return fixture1 == o.fixture1 && fixture2 == o.fixture2;
    }
};

struct ContactConstraintIdHash {
    std::size_t operator()(const ContactConstraintId& id) const {
        FixtureKeyHash h;
        std::size_t const h1 = h(id.fixture1);
        std::size_t const h2 = h(id.fixture2);
        return h1 ^ (h2 << 1);
    }
};

struct ContactConstraint {
    FixtureKey fixture1;
    FixtureKey fixture2;

    Vector normal;         ///< from body 1 toward body 2
    Vector tangent;
    std::vector<Contact> contacts;

    double friction = 0.0;
    double restitution = 0.0;
    bool sensor = false;

    // two-point block solver data
    Matrix22 K;
    Matrix22 invK;
    bool blockSolve = false;

    ContactConstraint() = default;

    /**
     * @brief Builds contacts from a manifold
     *
     * Each manifold point becomes a contact anchored in both bodies' local
     * frames with zero impulses.
     */
    ContactConstraint(const Collision& collision, const Transform& t1, const Transform& t2,
                      double friction, double restitution, bool sensor);

    ContactConstraintId getId() const { return {fixture1, fixture2}; }
    entt::entity getBody1() const { return fixture1.body; }
    entt::entity getBody2() const { return fixture2.body; }

    /** @brief True if any contact survived listener vetoes */
    bool hasEnabledContact() const;
};

} // namespace RigidBodyCollision

#endif
