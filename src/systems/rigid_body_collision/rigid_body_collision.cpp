/**
 * @file rigid_body_collision.cpp
 * @brief Implementation of the main collision system pipeline
 */

#include <cmath>
#include <vector>
#include <iostream>

#include "collide2d/core/debug.hpp"
#include "collide2d/core/profile.hpp"
#include "collide2d/algo/gjk.hpp"
#include "collide2d/components/basic.hpp"
#include "collide2d/systems/rigid_body_collision/rigid_body_collision.hpp"
#include "collide2d/systems/rigid_body_collision/body_access.hpp"
#include "collide2d/systems/rigid_body_collision/contact_solver.hpp"
#include "collide2d/systems/rigid_body_collision/toi_solver.hpp"

namespace Systems
{

using namespace RigidBodyCollision;

RigidBodyCollisionSystem::RigidBodyCollisionSystem()
    : RigidBodyCollisionSystem(Settings())
{
}

RigidBodyCollisionSystem::RigidBodyCollisionSystem(const Settings &s)
    : settings(s),
      broadphase(s.AABBExpansion),
      detector(s.Narrowphase),
      mixer(std::make_shared<DefaultCoefficientMixer>())
{
    settings.validate();
}

void RigidBodyCollisionSystem::setSettings(const Settings &s)
{
    s.validate();
    bool const rebuild = s.AABBExpansion != settings.AABBExpansion;
    settings = s;
    detector.setPrimary(settings.Narrowphase);
    if (rebuild) {
        // proxies are re-added with the new margin on the next update
        broadphase = Broadphase(settings.AABBExpansion);
        registered.clear();
    }
}

void RigidBodyCollisionSystem::setCoefficientMixer(std::shared_ptr<const CoefficientMixer> m)
{
    if (m) {
        mixer = std::move(m);
    } else {
        mixer = std::make_shared<DefaultCoefficientMixer>();
    }
}

void RigidBodyCollisionSystem::addListener(std::shared_ptr<ContactListener> listener)
{
    contactManager.addListener(std::move(listener));
}

bool RigidBodyCollisionSystem::removeListener(const std::shared_ptr<ContactListener> &listener)
{
    return contactManager.removeListener(listener);
}

void RigidBodyCollisionSystem::reset()
{
    broadphase.clear();
    registered.clear();
    initialTransforms.clear();
    contactManager.reset();
    islands.clear();
}

//------------------------------------------------------------------------------
// Pipeline stages
//------------------------------------------------------------------------------

void RigidBodyCollisionSystem::updateBroadphase(entt::registry &registry)
{
    PROFILE_SCOPE("Broadphase");

    // drop bodies that were destroyed or lost their collider
    for (auto it = registered.begin(); it != registered.end();) {
        if (!registry.valid(it->first) || !registry.all_of<Components::Collider>(it->first)) {
            broadphase.remove(it->first);
            it = registered.erase(it);
        } else {
            ++it;
        }
    }

    initialTransforms.clear();
    auto view = registry.view<Components::Collider>();
    for (auto e : view) {
        const auto &collider = view.get<Components::Collider>(e);
        std::size_t const count = collider.fixtures.size();

        auto it = registered.find(e);
        if (it != registered.end()) {
            for (std::size_t i = count; i < it->second; ++i) {
                broadphase.remove(FixtureKey{e, i});
            }
        }

        broadphase.update(registry, e);
        registered[e] = count;
        initialTransforms[e] = getTransform(registry, e);
    }
}

bool RigidBodyCollisionSystem::allowPair(const entt::registry &registry,
                                         const FixtureKey &a, const FixtureKey &b) const
{
    const auto *fa = getFixture(registry, a);
    const auto *fb = getFixture(registry, b);
    if (fa == nullptr || fb == nullptr || !fa->shape || !fb->shape) {
        return false;
    }
    if ((fa->category & fb->mask) == 0 || (fb->category & fa->mask) == 0) {
        return false;
    }
    // static bodies never collide with each other
    return !(isStatic(registry, a.body) && isStatic(registry, b.body));
}

void RigidBodyCollisionSystem::buildConstraints(const entt::registry &registry,
                                                const std::vector<Collision> &collisions)
{
    PROFILE_SCOPE("ContactUpdate");

    contactManager.clear();
    for (const auto &c : collisions) {
        const auto *fa = getFixture(registry, c.a);
        const auto *fb = getFixture(registry, c.b);
        if (fa == nullptr || fb == nullptr) {
            continue;
        }

        double const friction = mixer->mixFriction(fa->friction, fb->friction);
        double const restitution = mixer->mixRestitution(fa->restitution, fb->restitution);
        bool const sensor = fa->sensor || fb->sensor;

        contactManager.add(ContactConstraint(c,
                                             getTransform(registry, c.a.body),
                                             getTransform(registry, c.b.body),
                                             friction, restitution, sensor));
    }

    contactManager.updateContacts(settings);
    contactManager.preSolveNotify();
}

void RigidBodyCollisionSystem::solveTimeOfImpact(entt::registry &registry)
{
    PROFILE_SCOPE("ContinuousCollision");

    bool const bulletsOnly = settings.ContinuousMode == ContinuousDetectionMode::BulletsOnly;

    for (const auto &entry : initialTransforms) {
        entt::entity const e = entry.first;
        const Transform &initial = entry.second;
        if (!registry.valid(e) || isStatic(registry, e)) {
            continue;
        }
        bool const bullet = registry.all_of<Components::Bullet>(e);
        if (bulletsOnly && !bullet) {
            continue;
        }

        Transform const current = getTransform(registry, e);
        Vector const dp = current.getTranslation() - initial.getTranslation();
        double const da = current.getAngle() - initial.getAngle();
        // too little motion to pass through anything
        if (dp.length() <= settings.LinearTolerance && std::fabs(da) <= settings.AngularTolerance) {
            continue;
        }

        const auto &collider = registry.get<Components::Collider>(e);

        bool found = false;
        double earliest = 1.0;
        TimeOfImpact best;
        FixtureKey bestSelf;
        FixtureKey bestOther;

        for (std::size_t i = 0; i < collider.fixtures.size(); ++i) {
            const auto &fixture = collider.fixtures[i];
            if (!fixture.shape || fixture.sensor) {
                continue;
            }
            FixtureKey const self{e, i};

            AABB const swept = AABB::combine(fixture.shape->createAABB(initial),
                                             fixture.shape->createAABB(current));

            auto candidates = broadphase.detect(swept, [&](const FixtureKey &k) {
                return k.body != e;
            });

            for (const auto &other : candidates) {
                if (!allowPair(registry, self, other)) {
                    continue;
                }
                const auto *otherFixture = getFixture(registry, other);
                if (otherFixture->sensor) {
                    continue;
                }
                // non-bullets only sweep against static geometry
                if (!bullet && !isStatic(registry, other.body)) {
                    continue;
                }

                Transform const otherFinal = getTransform(registry, other.body);
                auto it = initialTransforms.find(other.body);
                Transform const otherInitial = it != initialTransforms.end() ? it->second : otherFinal;
                Vector const odp = otherFinal.getTranslation() - otherInitial.getTranslation();
                double const oda = otherFinal.getAngle() - otherInitial.getAngle();

                TimeOfImpact toi;
                if (!advancement.solve(fixture.shape.get(), initial, dp, da,
                                       otherFixture->shape.get(), otherInitial, odp, oda,
                                       0.0, earliest, toi)) {
                    continue;
                }
                if (!found || toi.time < earliest) {
                    found = true;
                    earliest = toi.time;
                    best = toi;
                    bestSelf = self;
                    bestOther = other;
                }
            }
        }

        if (!found) {
            continue;
        }

        // move the fast body back to its first contact
        Transform const atImpact = initial.lerp(dp, da, earliest);
        setTransform(registry, e, atImpact);

        const auto *selfFixture = getFixture(registry, bestSelf);
        const auto *otherFixture = getFixture(registry, bestOther);
        Separation separation;
        if (GJKDistance(selfFixture->shape.get(), atImpact,
                        otherFixture->shape.get(), getTransform(registry, bestOther.body),
                        separation)) {
            best.separation = separation;
            TimeOfImpactSolver::solve(registry, e, bestOther.body, best, settings);
        }

        broadphase.update(registry, e);
        CollisionStats::countTimeOfImpact();
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "TOI: body " << entt::to_integral(e)
                  << " stopped at t=" << earliest << "\n");
    }
}

void RigidBodyCollisionSystem::update(entt::registry &registry)
{
    PROFILE_SCOPE("RigidBodyCollisionSystem");
    CollisionStats::reset();

    // 1) Broad-phase: refresh proxies and collect candidate pairs
    updateBroadphase(registry);
    std::vector<BroadphasePair> candidatePairs;
    {
        PROFILE_SCOPE("BroadphaseDetect");
        candidatePairs = broadphase.detect([&](const FixtureKey &a, const FixtureKey &b) {
            return allowPair(registry, a, b);
        });
    }
    CollisionStats::countPairs(candidatePairs.size());

    // 2) Narrow-phase: exact tests and contact points
    auto collisions = narrowPhase(registry, candidatePairs, detector, manifoldSolver);

    // 3) Contact update: warm starting and begin/persist/end
    buildConstraints(registry, collisions);

    // 4) Islands over dynamic bodies
    {
        PROFILE_SCOPE("Islands");
        std::vector<entt::entity> seeds;
        for (auto e : registry.view<Components::Collider>()) {
            if (!isStatic(registry, e)) {
                seeds.push_back(e);
            }
        }
        islands = buildIslands(registry, seeds, contactManager.getConstraints());
    }
    CollisionStats::countIslands(islands.size());

    // 5) Sequential impulses per island
    {
        PROFILE_SCOPE("Solve");
        ContactSolver solver;
        for (const auto &island : islands) {
            solver.solve(registry, island, contactManager.getConstraints(), settings);
        }
    }
    contactManager.postSolveNotify();

    // 6) Continuous collision for fast bodies
    if (settings.ContinuousMode != ContinuousDetectionMode::None) {
        solveTimeOfImpact(registry);
    }

    CollisionStats::print();
}

//------------------------------------------------------------------------------
// Queries
//------------------------------------------------------------------------------

bool RigidBodyCollisionSystem::raycast(const entt::registry &registry, const Geometry::Ray &ray,
                                       double maxLength, RaycastHit &hit,
                                       const BroadphaseItemFilter &filter) const
{
    bool found = false;
    for (const auto &key : broadphase.raycast(ray, maxLength, filter)) {
        const auto *fixture = getFixture(registry, key);
        if (fixture == nullptr || !fixture->shape) {
            continue;
        }
        RaycastResult result;
        if (!GJKRaycast(ray, maxLength, fixture->shape.get(), getTransform(registry, key.body), result)) {
            continue;
        }
        if (!found || result.distance < hit.result.distance) {
            found = true;
            hit.fixture = key;
            hit.result = result;
        }
    }
    return found;
}

std::vector<FixtureKey> RigidBodyCollisionSystem::query(const AABB &aabb) const
{
    return broadphase.detect(aabb);
}

} // namespace Systems
