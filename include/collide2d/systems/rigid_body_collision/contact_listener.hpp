/**
 * @file contact_listener.hpp
 * @brief Contact lifecycle notifications and the friction/restitution mixing policy
 *
 * Lifecycle of a contact point: begin, then persist on every later step the
 * point is matched, then end. Points involving a sensor fixture only report
 * sensed and are never solved.
 */

#ifndef COLLIDE2D_CONTACT_LISTENER_HPP
#define COLLIDE2D_CONTACT_LISTENER_HPP

#include <algorithm>
#include <cmath>

#include "collide2d/systems/rigid_body_collision/contact_constraint.hpp"

namespace RigidBodyCollision {

struct ContactPointId {
    ContactConstraintId constraint;
    ManifoldPointId point;
};

struct ContactPoint {
    ContactPointId id;
    FixtureKey fixture1;
    FixtureKey fixture2;
    Vector point;
    Vector normal;
    double depth = 0.0;
    bool sensor = false;
};

struct PersistedContactPoint : ContactPoint {
    Vector oldPoint;
    Vector oldNormal;
    double oldDepth = 0.0;
};

struct SolvedContactPoint : ContactPoint {
    double normalImpulse = 0.0;
    double tangentImpulse = 0.0;
};

/**
 * @class ContactListener
 * @brief Observer with veto power over contact resolution
 *
 * Returning false from begin, persist or preSolve disables that contact point
 * for this step. Detection is unaffected.
 */
class ContactListener {
public:
    virtual ~ContactListener() = default;

    virtual void sensed(const ContactPoint& /*point*/) {}
    virtual bool begin(const ContactPoint& /*point*/) { return true; }
    virtual bool persist(const PersistedContactPoint& /*point*/) { return true; }
    virtual void end(const ContactPoint& /*point*/) {}
    virtual bool preSolve(const ContactPoint& /*point*/) { return true; }
    virtual void postSolve(const SolvedContactPoint& /*point*/) {}
};

/**
 * @class CoefficientMixer
 * @brief Combines per-fixture friction and restitution into pair values
 */
class CoefficientMixer {
public:
    virtual ~CoefficientMixer() = default;
    virtual double mixFriction(double friction1, double friction2) const = 0;
    virtual double mixRestitution(double restitution1, double restitution2) const = 0;
};

/** Geometric mean friction, maximum restitution */
class DefaultCoefficientMixer : public CoefficientMixer {
public:
    double mixFriction(double friction1, double friction2) const override {
        return std::sqrt(friction1 * friction2);
    }
    double mixRestitution(double restitution1, double restitution2) const override {
        return std::max(restitution1, restitution2);
    }
};

} // namespace RigidBodyCollision

#endif
