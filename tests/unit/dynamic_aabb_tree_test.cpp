#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <set>
#include <utility>
#include <vector>

#include "collide2d/systems/rigid_body_collision/dynamic_aabb_tree.hpp"

using namespace RigidBodyCollision;

class DynamicAABBTreeTest : public ::testing::Test {
protected:
    DynamicAABBTree tree{0.0};
    std::vector<int> ids;
    std::vector<AABB> boxes;

    // Helper to insert a proxy with a unique fixture key
    int insert(const AABB& aabb) {
        FixtureKey key;
        key.body = static_cast<entt::entity>(ids.size());
        key.fixture = 0;
        int id = tree.createProxy(aabb, key);
        ids.push_back(id);
        boxes.push_back(aabb);
        return id;
    }

    void insertRandom(int count, unsigned seed) {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> pos(-50.0, 50.0);
        std::uniform_real_distribution<double> size(0.1, 4.0);
        for (int i = 0; i < count; ++i) {
            double x = pos(rng);
            double y = pos(rng);
            insert(AABB(x, y, x + size(rng), y + size(rng)));
        }
    }

    std::set<std::pair<int, int>> bruteForcePairs() const {
        std::set<std::pair<int, int>> pairs;
        for (std::size_t i = 0; i < ids.size(); ++i) {
            for (std::size_t j = i + 1; j < ids.size(); ++j) {
                if (tree.getFatAABB(ids[i]).overlaps(tree.getFatAABB(ids[j]))) {
                    pairs.insert(std::minmax(ids[i], ids[j]));
                }
            }
        }
        return pairs;
    }

    std::set<std::pair<int, int>> treePairs() const {
        std::set<std::pair<int, int>> pairs;
        tree.detectPairs([&](int a, int b) {
            auto inserted = pairs.insert(std::minmax(a, b));
            EXPECT_TRUE(inserted.second) << "pair reported twice";
        });
        return pairs;
    }
};

TEST_F(DynamicAABBTreeTest, EmptyTree) {
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_EQ(tree.getHeight(), -1);
    EXPECT_TRUE(tree.validate());
    EXPECT_TRUE(treePairs().empty());
}

TEST_F(DynamicAABBTreeTest, FatAABBIncludesExpansion) {
    DynamicAABBTree fat(0.5);
    int id = fat.createProxy(AABB(0.0, 0.0, 1.0, 1.0), FixtureKey{});
    const AABB& a = fat.getFatAABB(id);
    EXPECT_DOUBLE_EQ(a.min.x, -0.5);
    EXPECT_DOUBLE_EQ(a.max.y, 1.5);
    EXPECT_DOUBLE_EQ(fat.getExpansion(), 0.5);
}

TEST_F(DynamicAABBTreeTest, PairsMatchBruteForce) {
    insertRandom(200, 42);

    EXPECT_EQ(tree.size(), 200u);
    EXPECT_TRUE(tree.validate());
    EXPECT_LE(tree.getMaxBalance(), 1);
    EXPECT_EQ(treePairs(), bruteForcePairs());
}

TEST_F(DynamicAABBTreeTest, QueryMatchesBruteForce) {
    insertRandom(150, 7);

    AABB region(-10.0, -10.0, 10.0, 10.0);
    std::set<int> found;
    tree.query(region, [&](int id) {
        found.insert(id);
        return true;
    });

    std::set<int> expected;
    for (int id : ids) {
        if (tree.getFatAABB(id).overlaps(region)) {
            expected.insert(id);
        }
    }
    EXPECT_EQ(found, expected);
}

TEST_F(DynamicAABBTreeTest, QueryStopsWhenCallbackReturnsFalse) {
    insertRandom(50, 3);
    int visits = 0;
    tree.query(AABB(-100.0, -100.0, 100.0, 100.0), [&](int) {
        ++visits;
        return false;
    });
    EXPECT_EQ(visits, 1);
}

TEST_F(DynamicAABBTreeTest, RemoveAndMoveKeepInvariants) {
    insertRandom(120, 11);

    // remove every third proxy
    std::vector<int> kept;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i % 3 == 0) {
            tree.destroyProxy(ids[i]);
        } else {
            kept.push_back(ids[i]);
        }
    }
    ids = kept;
    EXPECT_EQ(tree.size(), kept.size());
    EXPECT_TRUE(tree.validate());
    EXPECT_LE(tree.getMaxBalance(), 1);

    // move the survivors far enough to leave their fat AABBs
    for (int id : ids) {
        const AABB fat = tree.getFatAABB(id);
        AABB moved(fat.min + Vector(5.0, -3.0), fat.max + Vector(5.0, -3.0));
        tree.moveProxy(id, moved, Vector(5.0, -3.0));
    }
    EXPECT_TRUE(tree.validate());
    EXPECT_LE(tree.getMaxBalance(), 1);
    EXPECT_EQ(treePairs(), bruteForcePairs());
}

TEST_F(DynamicAABBTreeTest, SmallMoveInsideFatAABBIsIgnored) {
    DynamicAABBTree fat(0.5);
    int id = fat.createProxy(AABB(0.0, 0.0, 1.0, 1.0), FixtureKey{});
    EXPECT_FALSE(fat.moveProxy(id, AABB(0.1, 0.1, 1.1, 1.1), Vector(0.1, 0.1)));
    EXPECT_TRUE(fat.moveProxy(id, AABB(3.0, 3.0, 4.0, 4.0), Vector(3.0, 3.0)));
    EXPECT_TRUE(fat.getFatAABB(id).contains(AABB(3.0, 3.0, 4.0, 4.0)));
}

TEST_F(DynamicAABBTreeTest, MovedProxyIsFattenedTowardTravel) {
    double const expansion = 0.5;
    DynamicAABBTree fat(expansion);
    int id = fat.createProxy(AABB(0.0, 0.0, 1.0, 1.0), FixtureKey{});

    // moving right: only the leading side grows by the predicted displacement
    double const dx = 3.0;
    AABB const tight(dx, 0.0, 1.0 + dx, 1.0);
    ASSERT_TRUE(fat.moveProxy(id, tight, Vector(dx, 0.0)));
    AABB const moved = fat.getFatAABB(id);
    EXPECT_GE(moved.max.x, tight.max.x + expansion + DynamicAABBTree::DISPLACEMENT_MULTIPLIER * dx - 1e-12);
    EXPECT_NEAR(moved.min.x, tight.min.x - expansion, 1e-12);
    EXPECT_NEAR(moved.min.y, tight.min.y - expansion, 1e-12);
    EXPECT_NEAR(moved.max.y, tight.max.y + expansion, 1e-12);

    // moving down-left grows the lower and left sides instead
    AABB const back(-10.0, -8.0, -9.0, -7.0);
    ASSERT_TRUE(fat.moveProxy(id, back, Vector(-2.0, -1.0)));
    AABB const down = fat.getFatAABB(id);
    EXPECT_NEAR(down.min.x, back.min.x - expansion - 4.0, 1e-12);
    EXPECT_NEAR(down.min.y, back.min.y - expansion - 2.0, 1e-12);
    EXPECT_NEAR(down.max.x, back.max.x + expansion, 1e-12);
    EXPECT_NEAR(down.max.y, back.max.y + expansion, 1e-12);
    EXPECT_TRUE(fat.validate());
}

TEST_F(DynamicAABBTreeTest, RaycastFindsCrossedProxies) {
    int hit = insert(AABB(4.0, -1.0, 5.0, 1.0));
    int miss = insert(AABB(4.0, 3.0, 5.0, 4.0));
    int behind = insert(AABB(-5.0, -1.0, -4.0, 1.0));

    std::set<int> found;
    tree.raycast(Geometry::Ray(Vector(0.0, 0.0), Vector(1.0, 0.0)), 10.0, [&](int id) {
        found.insert(id);
        return true;
    });
    EXPECT_EQ(found.count(hit), 1u);
    EXPECT_EQ(found.count(miss), 0u);
    EXPECT_EQ(found.count(behind), 0u);

    // bounded ray stops short
    found.clear();
    tree.raycast(Geometry::Ray(Vector(0.0, 0.0), Vector(1.0, 0.0)), 2.0, [&](int id) {
        found.insert(id);
        return true;
    });
    EXPECT_TRUE(found.empty());
}

TEST_F(DynamicAABBTreeTest, ClearEmptiesTree) {
    insertRandom(20, 5);
    tree.clear();
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_EQ(tree.getHeight(), -1);
    int count = 0;
    tree.forEachProxy([&](int) { ++count; });
    EXPECT_EQ(count, 0);
}
