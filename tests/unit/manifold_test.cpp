#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <variant>

#include "collide2d/components/basic.hpp"
#include "collide2d/geometry/circle.hpp"
#include "collide2d/geometry/polygon.hpp"
#include "collide2d/geometry/segment.hpp"
#include "collide2d/systems/rigid_body_collision/manifold_solver.hpp"
#include "collide2d/systems/rigid_body_collision/narrowphase.hpp"

using namespace RigidBodyCollision;

TEST(ManifoldTest, FaceToFaceBoxesGiveTwoPoints) {
    Geometry::Polygon a = Geometry::Polygon::rectangle(1.0, 1.0);
    Geometry::Polygon b = Geometry::Polygon::rectangle(1.0, 1.0);
    Transform ta;
    Transform tb(Vector(0.7, 0.0), 0.0);

    Penetration p;
    p.normal = Vector(1.0, 0.0);
    p.depth = 0.3;

    ClippingManifoldSolver solver;
    Manifold m;
    ASSERT_TRUE(solver.getManifold(p, a, ta, b, tb, m));
    ASSERT_EQ(m.points.size(), 2u);
    EXPECT_NEAR(m.normal.x, 1.0, 1e-12);
    for (const auto& mp : m.points) {
        EXPECT_NEAR(mp.depth, 0.3, 1e-12);
        EXPECT_NEAR(mp.point.x, 0.2, 1e-12);
        EXPECT_NEAR(std::fabs(mp.point.y), 0.5, 1e-12);
        EXPECT_FALSE(isDistanceId(mp.id));
    }
    EXPECT_NE(m.points[0].id, m.points[1].id);
}

TEST(ManifoldTest, OffsetBoxesAreClippedToReferenceEdge) {
    Geometry::Polygon a = Geometry::Polygon::rectangle(1.0, 1.0);
    Geometry::Polygon b = Geometry::Polygon::rectangle(1.0, 1.0);
    Transform ta;
    Transform tb(Vector(0.9, 0.6), 0.0);

    Penetration p;
    p.normal = Vector(1.0, 0.0);
    p.depth = 0.1;

    ClippingManifoldSolver solver;
    Manifold m;
    ASSERT_TRUE(solver.getManifold(p, a, ta, b, tb, m));
    ASSERT_EQ(m.points.size(), 2u);
    for (const auto& mp : m.points) {
        // every point lies within the reference edge's extent
        EXPECT_LE(mp.point.y, 0.5 + 1e-12);
        EXPECT_GE(mp.point.y, 0.1 - 1e-12);
        EXPECT_NEAR(mp.depth, 0.1, 1e-12);
    }
}

TEST(ManifoldTest, CircleGivesSinglePoint) {
    Geometry::Polygon box = Geometry::Polygon::rectangle(2.0, 2.0);
    Geometry::Circle c(0.5);
    Transform tBox;
    Transform tCircle(Vector(0.0, 1.4), 0.0);

    Penetration p;
    p.normal = Vector(0.0, 1.0);
    p.depth = 0.1;

    ClippingManifoldSolver solver;
    Manifold m;
    ASSERT_TRUE(solver.getManifold(p, box, tBox, c, tCircle, m));
    ASSERT_EQ(m.points.size(), 1u);
    EXPECT_TRUE(isDistanceId(m.points[0].id));
    EXPECT_NEAR(m.points[0].point.x, 0.0, 1e-12);
    EXPECT_NEAR(m.points[0].point.y, 0.9, 1e-12);
    EXPECT_NEAR(m.points[0].depth, 0.1, 1e-12);
    EXPECT_NEAR(m.normal.y, 1.0, 1e-12);
}

TEST(ManifoldTest, FlippedReferenceKeepsNormalFromAToB) {
    // A's face is tilted, B's is flat against the normal: B becomes the reference
    Geometry::Polygon a = Geometry::Polygon::rectangle(1.0, 1.0);
    Geometry::Segment ground(Vector(-5.0, 0.0), Vector(5.0, 0.0));
    Transform ta(Vector(0.0, 0.6), 0.3);
    Transform tg;

    Penetration p;
    p.normal = Vector(0.0, -1.0);
    p.depth = 0.05;

    ClippingManifoldSolver solver;
    Manifold m;
    ASSERT_TRUE(solver.getManifold(p, a, ta, ground, tg, m));
    EXPECT_LT(m.normal.y, -0.99);
    ASSERT_FALSE(m.points.empty());
    for (const auto& mp : m.points) {
        EXPECT_GE(mp.depth, 0.0);
    }
}

class NarrowphaseTest : public ::testing::Test {
protected:
    entt::registry registry;

    entt::entity createBody(double x, double y, std::shared_ptr<const Geometry::Shape> shape) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::AngularPosition>(entity, 0.0);
        Components::Collider collider;
        Components::Fixture fixture;
        fixture.shape = std::move(shape);
        collider.fixtures.push_back(fixture);
        registry.emplace<Components::Collider>(entity, collider);
        return entity;
    }
};

TEST_F(NarrowphaseTest, SatAndGjkAgreeOnBoxes) {
    auto box = std::make_shared<Geometry::Polygon>(Geometry::Polygon::rectangle(1.0, 1.0));
    auto a = createBody(0.0, 0.0, box);
    auto b = createBody(0.7, 0.0, box);
    std::vector<BroadphasePair> pairs{BroadphasePair{FixtureKey{a, 0}, FixtureKey{b, 0}}};

    ClippingManifoldSolver manifoldSolver;
    for (auto algorithm : {NarrowphaseAlgorithm::Sat, NarrowphaseAlgorithm::Gjk}) {
        NarrowphaseDetector detector(algorithm);
        auto collisions = narrowPhase(registry, pairs, detector, manifoldSolver);
        ASSERT_EQ(collisions.size(), 1u);
        EXPECT_NEAR(collisions[0].penetration.depth, 0.3, 1e-6);
        EXPECT_EQ(collisions[0].manifold.points.size(), 2u);
    }
}

TEST_F(NarrowphaseTest, PairIsOrderedByFixtureKey) {
    auto circle = std::make_shared<Geometry::Circle>(1.0);
    auto a = createBody(0.0, 0.0, circle);
    auto b = createBody(1.5, 0.0, circle);
    std::vector<BroadphasePair> pairs{BroadphasePair{FixtureKey{b, 0}, FixtureKey{a, 0}}};

    NarrowphaseDetector detector;
    ClippingManifoldSolver manifoldSolver;
    auto collisions = narrowPhase(registry, pairs, detector, manifoldSolver);
    ASSERT_EQ(collisions.size(), 1u);
    EXPECT_EQ(collisions[0].a.body, a);
    EXPECT_EQ(collisions[0].b.body, b);
    EXPECT_NEAR(collisions[0].manifold.normal.x, 1.0, 1e-12);
    EXPECT_NEAR(collisions[0].penetration.depth, 0.5, 1e-12);
}

TEST_F(NarrowphaseTest, SeparatedAndMissingPairsAreSkipped) {
    auto circle = std::make_shared<Geometry::Circle>(1.0);
    auto a = createBody(0.0, 0.0, circle);
    auto b = createBody(3.0, 0.0, circle);
    auto gone = createBody(0.5, 0.0, circle);
    registry.destroy(gone);

    std::vector<BroadphasePair> pairs{BroadphasePair{FixtureKey{a, 0}, FixtureKey{b, 0}},
                                      BroadphasePair{FixtureKey{a, 0}, FixtureKey{gone, 0}},
                                      BroadphasePair{FixtureKey{a, 0}, FixtureKey{b, 3}}};
    NarrowphaseDetector detector;
    ClippingManifoldSolver manifoldSolver;
    EXPECT_TRUE(narrowPhase(registry, pairs, detector, manifoldSolver).empty());
}

TEST(NarrowphaseDetectorTest, FallbackConditionSwitchesAlgorithm) {
    Geometry::Polygon box = Geometry::Polygon::rectangle(1.0, 1.0);
    Geometry::Circle circle(0.5);

    NarrowphaseDetector detector(NarrowphaseAlgorithm::Sat);
    EXPECT_EQ(detector.select(box, circle), NarrowphaseAlgorithm::Sat);

    detector.addFallbackCondition(Geometry::ShapeType::Circle, Geometry::ShapeType::Polygon);
    EXPECT_EQ(detector.select(box, circle), NarrowphaseAlgorithm::Gjk);
    EXPECT_EQ(detector.select(box, box), NarrowphaseAlgorithm::Sat);

    EXPECT_THROW(detector.detect(nullptr, Transform(), &box, Transform()), std::invalid_argument);
}
