#ifndef COLLIDE2D_COLLISION_DATA_HPP
#define COLLIDE2D_COLLISION_DATA_HPP

#include <cstddef>
#include <functional>
#include <tuple>
#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "collide2d/algo/collision_results.hpp"
#include "collide2d/math/vector_math.hpp"

namespace RigidBodyCollision {

// Identifies one fixture of one body
struct FixtureKey {
    entt::entity body = entt::null;
    std::size_t fixture = 0;

    bool operator==(const FixtureKey& o) const { return body == o.body && fixture == o.fixture; }
    bool operator!=(const FixtureKey& o) const { return !(*this == o); }
    bool operator<(const FixtureKey& o) const {
        auto const lhs = entt::to_integral(body);
        auto const rhs = entt::to_integral(o.body);
        return std::tie(lhs, fixture) < std::tie(rhs, o.fixture);
    }
};

struct FixtureKeyHash {
    std::size_t operator()(const FixtureKey& k) const {
        std::size_t const h1 = std::hash<std::size_t>{}(static_cast<std::size_t>(entt::to_integral(k.body)));
        std::size_t const h2 = std::hash<std::size_t>{}(k.fixture);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Broadphase output: two fixtures whose fat AABBs overlap
struct BroadphasePair {
    FixtureKey a;
    FixtureKey b;
};

// Manifold point produced by a single-vertex feature
struct DistanceId {
    bool operator==(const DistanceId&) const { return true; }
    bool operator!=(const DistanceId&) const { return false; }
};

// Manifold point produced by clipping an incident edge against a reference edge
struct IndexedId {
    int referenceEdge = 0;
    int incidentEdge = 0;
    int incidentVertex = 0;
    bool flipped = false;

    bool operator==(const IndexedId& o) const {
        return referenceEdge == o.referenceEdge && incidentEdge == o.incidentEdge &&
               incidentVertex == o.incidentVertex && flipped == o.flipped;
    }
    bool operator!=(const IndexedId& o) const { return !(*this == o); }
};

// Correlates a manifold point across steps for warm starting
using ManifoldPointId = std::variant<DistanceId, IndexedId>;

inline bool isDistanceId(const ManifoldPointId& id) {
    return std::holds_alternative<DistanceId>(id);
}

struct ManifoldPoint {
    ManifoldPointId id;
    Vector point;
    double depth = 0.0;
};

// Contact normal (A toward B) and up to two contact points
struct Manifold {
    Vector normal;
    std::vector<ManifoldPoint> points;

    void clear() {
        normal = Vector();
        points.clear();
    }
};

// Narrowphase output for one broadphase pair
struct Collision {
    FixtureKey a;
    FixtureKey b;
    Penetration penetration;
    Manifold manifold;
};

} // namespace RigidBodyCollision

#endif
