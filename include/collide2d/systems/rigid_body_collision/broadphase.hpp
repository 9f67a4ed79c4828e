/**
 * @file broadphase.hpp
 * @brief Broad-phase collision detection over a dynamic AABB tree
 *
 * Every fixture of every registered body owns one proxy in the tree. The
 * broadphase reports fixture pairs whose fattened AABBs overlap; the
 * narrowphase decides which of them actually touch.
 */

#ifndef COLLIDE2D_BROADPHASE_HPP
#define COLLIDE2D_BROADPHASE_HPP

#include <functional>
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>

#include "collide2d/geometry/ray.hpp"
#include "collide2d/geometry/shape.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"
#include "collide2d/systems/rigid_body_collision/dynamic_aabb_tree.hpp"

namespace RigidBodyCollision {

/** Return false to reject a candidate pair */
using BroadphasePairFilter = std::function<bool(const FixtureKey&, const FixtureKey&)>;

/** Return false to reject a single proxy in AABB and ray queries */
using BroadphaseItemFilter = std::function<bool(const FixtureKey&)>;

class Broadphase {
public:
    explicit Broadphase(double expansion = DEFAULT_AABB_EXPANSION);

    /**
     * @brief Registers one fixture
     *
     * A null shape is a no-op. Adding a key twice is the caller's error.
     */
    void add(const FixtureKey& key, const Geometry::Shape* shape, const Transform& transform);

    /**
     * @brief Registers every fixture of a body
     * @throws std::invalid_argument for an invalid entity or a body without Collider
     */
    void add(const entt::registry& registry, entt::entity body);

    /**
     * @brief Refreshes one fixture after its body moved
     *
     * A fixture that was never added is added.
     */
    void update(const FixtureKey& key, const Geometry::Shape* shape, const Transform& transform);

    /**
     * @brief Refreshes every fixture of a body
     * @throws std::invalid_argument for an invalid entity or a body without Collider
     */
    void update(const entt::registry& registry, entt::entity body);

    /** @return false if the key was not registered */
    bool remove(const FixtureKey& key);

    /** @brief Removes every proxy of a body */
    void remove(entt::entity body);

    bool contains(const FixtureKey& key) const;

    /**
     * @brief Fattened AABB of a fixture
     * @throws std::invalid_argument if the key is not registered
     */
    const AABB& getAABB(const FixtureKey& key) const;

    /**
     * @brief All overlapping proxy pairs
     *
     * Each unordered pair is reported once. Pairs of fixtures on the same body
     * are never reported.
     */
    std::vector<BroadphasePair> detect(const BroadphasePairFilter& filter = nullptr) const;

    /** @brief Proxies whose fattened AABB overlaps aabb */
    std::vector<FixtureKey> detect(const AABB& aabb, const BroadphaseItemFilter& filter = nullptr) const;

    /** @brief Proxies whose fattened AABB the ray crosses within maxLength (<= 0 unbounded) */
    std::vector<FixtureKey> raycast(const Geometry::Ray& ray, double maxLength,
                                    const BroadphaseItemFilter& filter = nullptr) const;

    /** @brief Exact AABB test for two registered fixtures */
    bool detect(const FixtureKey& a, const FixtureKey& b) const;

    void clear();
    std::size_t size() const { return proxies.size(); }
    double getExpansion() const { return tree.getExpansion(); }
    const DynamicAABBTree& getTree() const { return tree; }

private:
    struct Proxy {
        int id;
        Vector lastCenter;  ///< tight AABB centre at the last update
    };

    DynamicAABBTree tree;
    std::unordered_map<FixtureKey, Proxy, FixtureKeyHash> proxies;
};

} // namespace RigidBodyCollision

#endif
