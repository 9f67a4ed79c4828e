#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "collide2d/components/basic.hpp"
#include "collide2d/systems/rigid_body_collision/island.hpp"

using namespace RigidBodyCollision;

class IslandTest : public ::testing::Test {
protected:
    entt::registry registry;
    std::vector<ContactConstraint> constraints;

    entt::entity createDynamic() {
        auto e = registry.create();
        registry.emplace<Components::Mass>(e, 1.0);
        return e;
    }

    entt::entity createStatic() {
        auto e = registry.create();
        registry.emplace<Components::Boundary>(e);
        return e;
    }

    void connect(entt::entity a, entt::entity b, bool sensor = false) {
        ContactConstraint cc;
        cc.fixture1 = FixtureKey{a, 0};
        cc.fixture2 = FixtureKey{b, 0};
        cc.sensor = sensor;
        cc.contacts.emplace_back();
        constraints.push_back(cc);
    }

    static bool has(const Island& island, entt::entity e) {
        return std::count(island.bodies.begin(), island.bodies.end(), e) == 1;
    }

    static const Island* islandOf(const std::vector<Island>& islands, entt::entity e) {
        for (const auto& island : islands) {
            if (std::find(island.bodies.begin(), island.bodies.end(), e) != island.bodies.end()) {
                return &island;
            }
        }
        return nullptr;
    }
};

TEST_F(IslandTest, IsolatedBodiesFormSingleIslands) {
    auto a = createDynamic();
    auto b = createDynamic();
    auto islands = buildIslands(registry, {a, b}, constraints);

    ASSERT_EQ(islands.size(), 2u);
    for (const auto& island : islands) {
        EXPECT_EQ(island.bodies.size(), 1u);
        EXPECT_TRUE(island.constraints.empty());
    }
}

TEST_F(IslandTest, ChainIsOneIsland) {
    auto a = createDynamic();
    auto b = createDynamic();
    auto c = createDynamic();
    auto d = createDynamic();
    connect(a, b);
    connect(c, b);
    connect(c, d);

    auto islands = buildIslands(registry, {a, b, c, d}, constraints);
    ASSERT_EQ(islands.size(), 1u);
    EXPECT_EQ(islands[0].bodies.size(), 4u);
    EXPECT_EQ(islands[0].constraints.size(), 3u);
}

TEST_F(IslandTest, StaticBodyDoesNotJoinIslands) {
    auto ground = createStatic();
    auto left = createDynamic();
    auto right = createDynamic();
    connect(ground, left);
    connect(right, ground);

    auto islands = buildIslands(registry, {left, right}, constraints);
    ASSERT_EQ(islands.size(), 2u);

    const Island* li = islandOf(islands, left);
    const Island* ri = islandOf(islands, right);
    ASSERT_NE(li, nullptr);
    ASSERT_NE(ri, nullptr);
    EXPECT_NE(li, ri);

    // the ground shows up once in each island
    EXPECT_TRUE(has(*li, ground));
    EXPECT_TRUE(has(*ri, ground));
    EXPECT_EQ(li->constraints.size(), 1u);
    EXPECT_EQ(ri->constraints.size(), 1u);
}

TEST_F(IslandTest, StaticAddedOnceWithSeveralContacts) {
    auto ground = createStatic();
    auto a = createDynamic();
    auto b = createDynamic();
    connect(a, b);
    connect(a, ground);
    connect(b, ground);

    auto islands = buildIslands(registry, {a, b}, constraints);
    ASSERT_EQ(islands.size(), 1u);
    EXPECT_EQ(islands[0].bodies.size(), 3u);
    EXPECT_TRUE(has(islands[0], ground));
    EXPECT_EQ(islands[0].constraints.size(), 3u);
}

TEST_F(IslandTest, SensorsAndDisabledContactsAreNotEdges) {
    auto a = createDynamic();
    auto b = createDynamic();
    auto c = createDynamic();
    connect(a, b, true);
    connect(b, c);
    constraints.back().contacts[0].enabled = false;

    auto islands = buildIslands(registry, {a, b, c}, constraints);
    EXPECT_EQ(islands.size(), 3u);
}

TEST_F(IslandTest, SplitsWhenContactDisappears) {
    auto a = createDynamic();
    auto b = createDynamic();
    auto c = createDynamic();
    connect(a, b);
    connect(b, c);
    ASSERT_EQ(buildIslands(registry, {a, b, c}, constraints).size(), 1u);

    constraints.pop_back();
    auto islands = buildIslands(registry, {a, b, c}, constraints);
    ASSERT_EQ(islands.size(), 2u);
    EXPECT_EQ(islandOf(islands, a), islandOf(islands, b));
    EXPECT_NE(islandOf(islands, a), islandOf(islands, c));
}

TEST_F(IslandTest, EveryDynamicSeedInExactlyOneIsland) {
    auto ground = createStatic();
    std::vector<entt::entity> bodies;
    for (int i = 0; i < 12; ++i) {
        bodies.push_back(createDynamic());
    }
    for (int i = 0; i + 1 < 12; i += 3) {
        connect(bodies[i], bodies[i + 1]);
        connect(bodies[i + 1], ground);
    }

    auto islands = buildIslands(registry, bodies, constraints);
    for (auto e : bodies) {
        int count = 0;
        for (const auto& island : islands) {
            count += static_cast<int>(std::count(island.bodies.begin(), island.bodies.end(), e));
        }
        EXPECT_EQ(count, 1);
    }
}
