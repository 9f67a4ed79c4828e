/**
 * @file dynamic_aabb_tree.hpp
 * @brief Self-balancing bounding volume hierarchy over fattened AABBs
 *
 * Leaves hold one proxy each. A proxy's AABB is the true AABB expanded by a
 * margin so that small motions do not touch the tree. Insertion descends
 * greedily by perimeter growth and every modified ancestor is refit and
 * rotated so sibling heights never differ by more than one.
 *
 * Nodes live in a pool addressed by int ids; proxy ids are leaf node ids and
 * stay valid until destroyProxy.
 */

#ifndef COLLIDE2D_DYNAMIC_AABB_TREE_HPP
#define COLLIDE2D_DYNAMIC_AABB_TREE_HPP

#include <cstddef>
#include <limits>
#include <vector>

#include "collide2d/geometry/ray.hpp"
#include "collide2d/math/aabb.hpp"
#include "collide2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

constexpr double DEFAULT_AABB_EXPANSION = 0.2;

class DynamicAABBTree {
public:
    static constexpr int NULL_NODE = -1;

    /** multiple of the step displacement added ahead of a moving proxy */
    static constexpr double DISPLACEMENT_MULTIPLIER = 2.0;

    explicit DynamicAABBTree(double expansion = DEFAULT_AABB_EXPANSION);

    /**
     * @brief Inserts a proxy for a tight AABB
     * @return proxy id
     */
    int createProxy(const AABB& aabb, const FixtureKey& key);

    void destroyProxy(int proxyId);

    /**
     * @brief Updates a proxy after its shape moved
     *
     * Nothing happens while the fat AABB still contains the new tight AABB.
     * Otherwise the leaf is reinserted with the margin plus a predictive
     * extension along displacement.
     *
     * @return true if the leaf was reinserted
     */
    bool moveProxy(int proxyId, const AABB& aabb, const Vector& displacement);

    const AABB& getFatAABB(int proxyId) const { return nodes[proxyId].aabb; }
    const FixtureKey& getUserData(int proxyId) const { return nodes[proxyId].key; }

    /**
     * @brief Visits every proxy whose fat AABB overlaps aabb
     * @param callback bool(int proxyId), return false to stop
     */
    template <typename Callback>
    void query(const AABB& aabb, Callback&& callback) const {
        if (root == NULL_NODE) {
            return;
        }
        std::vector<int> stack;
        stack.push_back(root);
        while (!stack.empty()) {
            int const id = stack.back();
            stack.pop_back();
            const TreeNode& node = nodes[id];
            if (!node.aabb.overlaps(aabb)) {
                continue;
            }
            if (node.isLeaf()) {
                if (!callback(id)) {
                    return;
                }
            } else {
                stack.push_back(node.child1);
                stack.push_back(node.child2);
            }
        }
    }

    /**
     * @brief Visits every proxy whose fat AABB the ray segment crosses
     * @param maxLength <= 0 for an unbounded ray
     * @param callback bool(int proxyId), return false to stop
     */
    template <typename Callback>
    void raycast(const Geometry::Ray& ray, double maxLength, Callback&& callback) const {
        if (root == NULL_NODE) {
            return;
        }
        double const length = maxLength > 0.0 ? maxLength : std::numeric_limits<double>::max();
        std::vector<int> stack;
        stack.push_back(root);
        while (!stack.empty()) {
            int const id = stack.back();
            stack.pop_back();
            const TreeNode& node = nodes[id];
            if (!node.aabb.intersectsRay(ray.start, ray.direction, length)) {
                continue;
            }
            if (node.isLeaf()) {
                if (!callback(id)) {
                    return;
                }
            } else {
                stack.push_back(node.child1);
                stack.push_back(node.child2);
            }
        }
    }

    /**
     * @brief Reports every overlapping pair of proxies exactly once
     *
     * Each leaf queries the tree with its own AABB; leaves already used as a
     * query are marked tested and skipped afterwards.
     *
     * @param callback void(int proxyA, int proxyB)
     */
    template <typename Callback>
    void detectPairs(Callback&& callback) const {
        std::vector<bool> tested(nodes.size(), false);
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            const TreeNode& leaf = nodes[i];
            if (leaf.height != 0) {
                continue;  // internal or free
            }
            int const self = static_cast<int>(i);
            query(leaf.aabb, [&](int other) {
                if (other != self && !tested[other]) {
                    callback(self, other);
                }
                return true;
            });
            tested[i] = true;
        }
    }

    /** @brief Visits every proxy id */
    template <typename Callback>
    void forEachProxy(Callback&& callback) const {
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i].height == 0) {
                callback(static_cast<int>(i));
            }
        }
    }

    void clear();

    /** @brief Height of the root, 0 for a single leaf, -1 when empty */
    int getHeight() const;

    /** @brief Largest sibling height difference over all internal nodes */
    int getMaxBalance() const;

    std::size_t size() const { return leafCount; }
    double getExpansion() const { return expansion; }

    /**
     * @brief Checks parent links, heights and AABB containment
     * @return true if the structure is consistent
     */
    bool validate() const;

private:
    struct TreeNode {
        AABB aabb;
        FixtureKey key;
        int parent = NULL_NODE;   ///< next free node while on the free list
        int child1 = NULL_NODE;
        int child2 = NULL_NODE;
        int height = -1;          ///< 0 for leaves, -1 when free

        bool isLeaf() const { return child1 == NULL_NODE; }
    };

    int allocateNode();
    void freeNode(int id);
    void insertLeaf(int leaf);
    void removeLeaf(int leaf);
    int balance(int id);
    void refitUpwards(int id);
    bool validateNode(int id, std::size_t& leaves) const;

    std::vector<TreeNode> nodes;
    int root = NULL_NODE;
    int freeList = NULL_NODE;
    std::size_t leafCount = 0;
    double expansion;
};

} // namespace RigidBodyCollision

#endif
