#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "collide2d/components/basic.hpp"
#include "collide2d/systems/rigid_body_collision/contact_solver.hpp"

using namespace RigidBodyCollision;

class ContactSolverTest : public ::testing::Test {
protected:
    entt::registry registry;
    entt::entity ground;
    Settings settings;
    std::vector<ContactConstraint> constraints;

    void SetUp() override {
        ground = registry.create();
        registry.emplace<Components::Position>(ground, 0.0, 0.0);
        registry.emplace<Components::Boundary>(ground);
    }

    entt::entity createBody(double x, double y, double mass, double inertia, Vector velocity) {
        auto e = registry.create();
        registry.emplace<Components::Position>(e, x, y);
        registry.emplace<Components::AngularPosition>(e, 0.0);
        registry.emplace<Components::Mass>(e, mass);
        registry.emplace<Components::Inertia>(e, inertia);
        registry.emplace<Components::Velocity>(e, velocity);
        registry.emplace<Components::AngularVelocity>(e, 0.0);
        return e;
    }

    // Helper: ground-to-body constraint with normal +y
    void addGroundContact(entt::entity body, const std::vector<Vector>& points, double depth,
                          double friction = 0.0, double restitution = 0.0) {
        Collision c;
        c.a = FixtureKey{ground, 0};
        c.b = FixtureKey{body, 0};
        c.manifold.normal = Vector(0.0, 1.0);
        int vertex = 0;
        for (const auto& p : points) {
            ManifoldPointId id = DistanceId{};
            if (points.size() > 1) {
                IndexedId indexed;
                indexed.incidentVertex = vertex++;
                id = indexed;
            }
            c.manifold.points.push_back(ManifoldPoint{id, p, depth});
        }
        constraints.emplace_back(c, Transform(), Transform(Vector(registry.get<Components::Position>(body)), 0.0),
                                 friction, restitution, false);
    }

    Island islandFor(entt::entity body) const {
        Island island;
        island.bodies = {body, ground};
        for (std::size_t i = 0; i < constraints.size(); ++i) {
            island.constraints.push_back(i);
        }
        return island;
    }
};

TEST_F(ContactSolverTest, StopsApproachingBody) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, -1.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);

    EXPECT_NEAR(registry.get<Components::Velocity>(ball).y, 0.0, 1e-12);
    EXPECT_NEAR(constraints[0].contacts[0].jn, 1.0, 1e-12);
    // pushed up, not down
    EXPECT_GT(registry.get<Components::Position>(ball).y, 0.49);
    // the static body is untouched
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(ground).y, 0.0);
}

TEST_F(ContactSolverTest, SeparatingBodyIsNotPulledBack) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, 2.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);

    EXPECT_NEAR(registry.get<Components::Velocity>(ball).y, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(constraints[0].contacts[0].jn, 0.0);
}

TEST_F(ContactSolverTest, RestitutionAboveThresholdBounces) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, -5.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01, 0.0, 0.5);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).y, 2.5, 1e-9);
}

TEST_F(ContactSolverTest, RestitutionBelowThresholdRests) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, -0.5));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01, 0.0, 0.5);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).y, 0.0, 1e-12);
}

TEST_F(ContactSolverTest, FrictionIsBoundedByCoulombCone) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(2.0, -1.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01, 0.5);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);

    const Contact& c = constraints[0].contacts[0];
    EXPECT_NEAR(c.jn, 1.0, 1e-12);
    EXPECT_NEAR(std::fabs(c.jt), 0.5, 1e-12);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).x, 1.5, 1e-9);
    EXPECT_NE(registry.get<Components::AngularVelocity>(ball).omega, 0.0);
}

TEST_F(ContactSolverTest, FrictionlessContactKeepsTangentVelocity) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(2.0, -1.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01, 0.0);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).x, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(constraints[0].contacts[0].jt, 0.0);
}

TEST_F(ContactSolverTest, BlockSolverSharesLoadEvenly) {
    auto box = createBody(0.0, 0.49, 1.0, 1.0 / 6.0, Vector(0.0, -1.0));
    addGroundContact(box, {Vector(-0.5, -0.01), Vector(0.5, -0.01)}, 0.01);

    ContactSolver solver;
    solver.solve(registry, islandFor(box), constraints, settings);

    EXPECT_TRUE(constraints[0].blockSolve);
    EXPECT_NEAR(constraints[0].contacts[0].jn, 0.5, 1e-9);
    EXPECT_NEAR(constraints[0].contacts[1].jn, 0.5, 1e-9);
    EXPECT_NEAR(registry.get<Components::Velocity>(box).y, 0.0, 1e-9);
    EXPECT_NEAR(registry.get<Components::AngularVelocity>(box).omega, 0.0, 1e-9);
}

TEST_F(ContactSolverTest, WarmStartedSolutionIsStable) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, -1.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01);
    Island island = islandFor(ball);

    ContactSolver solver;
    solver.initialize(registry, island, constraints, settings);
    solver.warmStart();
    for (int i = 0; i < settings.VelocityIterations; ++i) {
        solver.solveVelocityConstraints();
    }
    double const solved = constraints[0].contacts[0].jn;

    // same incoming state, impulses carried over: further iterations change nothing
    solver.initialize(registry, island, constraints, settings);
    solver.warmStart();
    solver.solveVelocityConstraints();
    EXPECT_NEAR(constraints[0].contacts[0].jn, solved, 1e-9);
    for (const auto& b : solver.getBodies()) {
        if (b.entity == ball) {
            EXPECT_NEAR(b.velocity.y, 0.0, 1e-9);
        }
    }
}

TEST_F(ContactSolverTest, WarmStartingDisabledZeroesImpulses) {
    settings.WarmStartingEnabled = false;
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, 0.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01);
    constraints[0].contacts[0].jn = 3.0;

    ContactSolver solver;
    solver.initialize(registry, islandFor(ball), constraints, settings);
    solver.warmStart();
    EXPECT_DOUBLE_EQ(constraints[0].contacts[0].jn, 0.0);
}

TEST_F(ContactSolverTest, DisabledContactIsIgnored) {
    auto ball = createBody(0.0, 0.49, 1.0, 0.125, Vector(0.0, -1.0));
    addGroundContact(ball, {Vector(0.0, -0.01)}, 0.01);
    constraints[0].contacts[0].enabled = false;

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).y, -1.0, 1e-12);
}

TEST_F(ContactSolverTest, PositionSolveResolvesDeepPenetration) {
    auto ball = createBody(0.0, 0.4, 1.0, 0.125, Vector(0.0, 0.0));
    addGroundContact(ball, {Vector(0.0, -0.1)}, 0.1);

    ContactSolver solver;
    solver.solve(registry, islandFor(ball), constraints, settings);

    double const moved = registry.get<Components::Position>(ball).y - 0.4;
    EXPECT_GT(moved, 0.07);
    // never pushed past the allowed overlap
    EXPECT_LT(moved, 0.1 - settings.LinearTolerance + 1e-12);
}

TEST_F(ContactSolverTest, PositionSolveClampsRotation) {
    // off-center contact: the position pass both lifts and turns the body
    auto clamped = createBody(0.0, 0.4, 1.0, 0.125, Vector(0.0, 0.0));
    addGroundContact(clamped, {Vector(0.5, 0.3)}, 0.1);

    settings.MaxAngularCorrection = 1e-3;
    ContactSolver solver;
    solver.solve(registry, islandFor(clamped), constraints, settings);

    double const turned = std::fabs(registry.get<Components::AngularPosition>(clamped).angle);
    EXPECT_GT(turned, 0.0);
    EXPECT_LE(turned, settings.PositionIterations * settings.MaxAngularCorrection + 1e-12);

    // with the default clamp a single iteration already turns it further
    constraints.clear();
    Settings defaults;
    auto loose = createBody(0.0, 0.4, 1.0, 0.125, Vector(0.0, 0.0));
    addGroundContact(loose, {Vector(0.5, 0.3)}, 0.1);
    ContactSolver unclamped;
    unclamped.solve(registry, islandFor(loose), constraints, defaults);
    EXPECT_GT(std::fabs(registry.get<Components::AngularPosition>(loose).angle), 0.02);
}

TEST_F(ContactSolverTest, IntegrationIsClampedByMaxTranslation) {
    auto ball = createBody(0.0, 5.0, 1.0, 0.125, Vector(600.0, 0.0));
    Island island;
    island.bodies = {ball};

    ContactSolver solver;
    solver.solve(registry, island, constraints, settings);
    EXPECT_NEAR(registry.get<Components::Position>(ball).x, settings.MaxTranslation, 1e-9);
    EXPECT_NEAR(registry.get<Components::Velocity>(ball).x, settings.MaxTranslation / settings.StepFrequency, 1e-6);
}
