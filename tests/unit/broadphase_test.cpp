#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "collide2d/components/basic.hpp"
#include "collide2d/geometry/circle.hpp"
#include "collide2d/geometry/polygon.hpp"
#include "collide2d/systems/rigid_body_collision/broadphase.hpp"

using namespace RigidBodyCollision;

class BroadphaseTest : public ::testing::Test {
protected:
    entt::registry registry;
    Broadphase broadphase{0.1};

    // Helper to create a body with one circle fixture
    entt::entity createCircle(double x, double y, double radius) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        Components::Collider collider;
        Components::Fixture fixture;
        fixture.shape = std::make_shared<Geometry::Circle>(radius);
        collider.fixtures.push_back(fixture);
        registry.emplace<Components::Collider>(entity, collider);
        return entity;
    }
};

TEST_F(BroadphaseTest, AddRequiresColliderAndValidEntity) {
    auto bare = registry.create();
    EXPECT_THROW(broadphase.add(registry, bare), std::invalid_argument);

    auto dead = createCircle(0.0, 0.0, 1.0);
    registry.destroy(dead);
    EXPECT_THROW(broadphase.add(registry, dead), std::invalid_argument);
}

TEST_F(BroadphaseTest, NullShapeIsIgnored) {
    broadphase.add(FixtureKey{registry.create(), 0}, nullptr, Transform());
    EXPECT_EQ(broadphase.size(), 0u);
}

TEST_F(BroadphaseTest, DetectsOverlappingBodiesOnce) {
    auto a = createCircle(0.0, 0.0, 1.0);
    auto b = createCircle(1.5, 0.0, 1.0);
    auto c = createCircle(10.0, 0.0, 1.0);
    broadphase.add(registry, a);
    broadphase.add(registry, b);
    broadphase.add(registry, c);

    auto pairs = broadphase.detect();
    ASSERT_EQ(pairs.size(), 1u);
    bool const ab = (pairs[0].a.body == a && pairs[0].b.body == b) ||
                    (pairs[0].a.body == b && pairs[0].b.body == a);
    EXPECT_TRUE(ab);

    EXPECT_TRUE(broadphase.detect(FixtureKey{a, 0}, FixtureKey{b, 0}));
    EXPECT_FALSE(broadphase.detect(FixtureKey{a, 0}, FixtureKey{c, 0}));
}

TEST_F(BroadphaseTest, FixturesOfOneBodyNeverPair) {
    auto body = createCircle(0.0, 0.0, 1.0);
    Components::Fixture second;
    second.shape = std::make_shared<Geometry::Circle>(1.0, Vector(0.5, 0.0));
    registry.get<Components::Collider>(body).fixtures.push_back(second);

    broadphase.add(registry, body);
    EXPECT_EQ(broadphase.size(), 2u);
    EXPECT_TRUE(broadphase.detect().empty());
}

TEST_F(BroadphaseTest, FilterRejectsPairs) {
    auto a = createCircle(0.0, 0.0, 1.0);
    auto b = createCircle(1.0, 0.0, 1.0);
    broadphase.add(registry, a);
    broadphase.add(registry, b);

    auto pairs = broadphase.detect([](const FixtureKey&, const FixtureKey&) { return false; });
    EXPECT_TRUE(pairs.empty());
}

TEST_F(BroadphaseTest, UpdateFollowsMovement) {
    auto a = createCircle(0.0, 0.0, 1.0);
    auto b = createCircle(5.0, 0.0, 1.0);
    broadphase.add(registry, a);
    broadphase.add(registry, b);
    EXPECT_TRUE(broadphase.detect().empty());

    registry.replace<Components::Position>(b, 1.0, 0.0);
    broadphase.update(registry, b);
    EXPECT_EQ(broadphase.detect().size(), 1u);
    EXPECT_TRUE(broadphase.getAABB(FixtureKey{b, 0}).contains(AABB(0.0, -1.0, 2.0, 1.0)));
}

TEST_F(BroadphaseTest, RemoveDropsProxies) {
    auto a = createCircle(0.0, 0.0, 1.0);
    broadphase.add(registry, a);
    EXPECT_TRUE(broadphase.contains(FixtureKey{a, 0}));

    EXPECT_TRUE(broadphase.remove(FixtureKey{a, 0}));
    EXPECT_FALSE(broadphase.remove(FixtureKey{a, 0}));
    EXPECT_FALSE(broadphase.contains(FixtureKey{a, 0}));
    EXPECT_THROW(broadphase.getAABB(FixtureKey{a, 0}), std::invalid_argument);
}

TEST_F(BroadphaseTest, AABBQueryAndRaycast) {
    auto near = createCircle(3.0, 0.0, 0.5);
    auto far = createCircle(0.0, 8.0, 0.5);
    broadphase.add(registry, near);
    broadphase.add(registry, far);

    auto inBox = broadphase.detect(AABB(2.0, -1.0, 4.0, 1.0));
    ASSERT_EQ(inBox.size(), 1u);
    EXPECT_EQ(inBox[0].body, near);

    auto hits = broadphase.raycast(Geometry::Ray(Vector(0.0, 0.0), Vector(1.0, 0.0)), 0.0);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].body, near);

    auto filtered = broadphase.raycast(Geometry::Ray(Vector(0.0, 0.0), Vector(0.0, 1.0)), 0.0,
                                       [&](const FixtureKey& k) { return k.body != far; });
    EXPECT_TRUE(filtered.empty());
}
