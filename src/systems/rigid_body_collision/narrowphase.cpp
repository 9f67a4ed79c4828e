/**
 * @file narrowphase.cpp
 * @brief SAT / GJK+EPA dispatch and per-pair manifold generation
 */

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <entt/entt.hpp>
#include <iostream>

#include "collide2d/systems/rigid_body_collision/narrowphase.hpp"
#include "collide2d/algo/epa.hpp"
#include "collide2d/algo/gjk.hpp"
#include "collide2d/algo/sat.hpp"
#include "collide2d/core/debug.hpp"
#include "collide2d/core/profile.hpp"
#include "collide2d/systems/rigid_body_collision/body_access.hpp"

#define ENABLE_NARROWPHASE_DEBUG 0

#define DEBUG(x) do { \
    if (ENABLE_NARROWPHASE_DEBUG) { \
        std::cout << "[DEBUG NARROWPHASE] " << x << std::endl; \
    } \
} while(0)

namespace RigidBodyCollision {

namespace {

bool bothCircles(const Geometry::Shape& a, const Geometry::Shape& b) {
    return a.getType() == Geometry::ShapeType::Circle && b.getType() == Geometry::ShapeType::Circle;
}

void requireShapes(const Geometry::Shape* a, const Geometry::Shape* b) {
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("NarrowphaseDetector: shape must not be null");
    }
}

} // namespace

NarrowphaseDetector::NarrowphaseDetector(NarrowphaseAlgorithm primary) : primary(primary) {}

void NarrowphaseDetector::addFallbackCondition(Geometry::ShapeType a, Geometry::ShapeType b) {
    fallbackConditions.emplace_back(a, b);
}

NarrowphaseAlgorithm NarrowphaseDetector::select(const Geometry::Shape& a, const Geometry::Shape& b) const {
    for (const auto& [ta, tb] : fallbackConditions) {
        bool const match = (a.getType() == ta && b.getType() == tb) ||
                           (a.getType() == tb && b.getType() == ta);
        if (match) {
            return primary == NarrowphaseAlgorithm::Sat ? NarrowphaseAlgorithm::Gjk : NarrowphaseAlgorithm::Sat;
        }
    }
    return primary;
}

bool NarrowphaseDetector::detect(const Geometry::Shape* a, const Transform& ta,
                                 const Geometry::Shape* b, const Transform& tb,
                                 Penetration& penetration) const {
    requireShapes(a, b);
    if (bothCircles(*a, *b)) {
        return circleDetect(*a, ta, *b, tb, penetration);
    }

    if (select(*a, *b) == NarrowphaseAlgorithm::Sat) {
        return SATDetect(a, ta, b, tb, penetration);
    }

    Simplex simplex;
    if (!GJKIntersect(a, ta, b, tb, simplex)) {
        return false;
    }
    std::optional<Penetration> const result = EPA(a, ta, b, tb, simplex);
    if (!result) {
        return false;
    }
    penetration = *result;
    return true;
}

bool NarrowphaseDetector::detect(const Geometry::Shape* a, const Transform& ta,
                                 const Geometry::Shape* b, const Transform& tb) const {
    requireShapes(a, b);
    if (bothCircles(*a, *b)) {
        Penetration ignored;
        return circleDetect(*a, ta, *b, tb, ignored);
    }
    if (select(*a, *b) == NarrowphaseAlgorithm::Sat) {
        return SATDetect(a, ta, b, tb);
    }
    Simplex simplex;
    return GJKIntersect(a, ta, b, tb, simplex);
}

std::vector<Collision> narrowPhase(const entt::registry& registry,
                                   const std::vector<BroadphasePair>& pairs,
                                   const NarrowphaseDetector& detector,
                                   const ClippingManifoldSolver& manifoldSolver)
{
    PROFILE_SCOPE("NarrowPhase");

    std::vector<Collision> collisions;
    collisions.reserve(pairs.size());

    for (const auto& pair : pairs) {
        FixtureKey ka = pair.a;
        FixtureKey kb = pair.b;
        if (kb < ka) {
            std::swap(ka, kb);
        }

        const Components::Fixture* fa = getFixture(registry, ka);
        const Components::Fixture* fb = getFixture(registry, kb);
        if (fa == nullptr || fb == nullptr || !fa->shape || !fb->shape) {
            continue;
        }

        Transform const ta = getTransform(registry, ka.body);
        Transform const tb = getTransform(registry, kb.body);

        Collision c;
        c.a = ka;
        c.b = kb;
        if (!detector.detect(fa->shape.get(), ta, fb->shape.get(), tb, c.penetration)) {
            continue;
        }
        if (!manifoldSolver.getManifold(c.penetration, *fa->shape, ta, *fb->shape, tb, c.manifold)) {
            DEBUG("pair touching but no manifold points");
            continue;
        }

        CollisionStats::countManifold(c.manifold.points.size(), c.penetration.depth);
        collisions.push_back(std::move(c));
    }

    DEBUG(collisions.size() << " collisions from " << pairs.size() << " pairs");
    return collisions;
}

} // namespace RigidBodyCollision
