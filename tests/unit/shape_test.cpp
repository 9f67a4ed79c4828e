#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

#include "collide2d/geometry/capsule.hpp"
#include "collide2d/geometry/circle.hpp"
#include "collide2d/geometry/polygon.hpp"
#include "collide2d/geometry/ray.hpp"
#include "collide2d/geometry/segment.hpp"

using namespace Geometry;

TEST(ShapeTest, InvalidConstructionThrows) {
    EXPECT_THROW(Circle(0.0), std::invalid_argument);
    EXPECT_THROW(Circle(-1.0), std::invalid_argument);
    EXPECT_THROW(Polygon({Vector(0, 0), Vector(1, 0)}), std::invalid_argument);
    // clockwise
    EXPECT_THROW(Polygon({Vector(0, 0), Vector(0, 1), Vector(1, 0)}), std::invalid_argument);
    // collinear
    EXPECT_THROW(Polygon({Vector(0, 0), Vector(1, 0), Vector(2, 0)}), std::invalid_argument);
    EXPECT_THROW(Polygon::rectangle(0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Segment(Vector(1, 1), Vector(1, 1)), std::invalid_argument);
    EXPECT_THROW(Capsule(1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Capsule(-1.0, 2.0), std::invalid_argument);
    EXPECT_THROW(Ray(Vector(0, 0), Vector(0, 0)), std::invalid_argument);
}

TEST(ShapeTest, RectangleGeometry) {
    Polygon box = Polygon::rectangle(2.0, 1.0);
    ASSERT_EQ(box.getVertices().size(), 4u);
    EXPECT_NEAR(box.getCenter().x, 0.0, 1e-12);
    EXPECT_NEAR(box.getCenter().y, 0.0, 1e-12);
    EXPECT_NEAR(box.getRadius(), std::sqrt(1.25), 1e-12);

    // outward normals
    for (std::size_t i = 0; i < box.getVertices().size(); ++i) {
        const Vector& n = box.getNormals()[i];
        EXPECT_NEAR(n.length(), 1.0, 1e-12);
        EXPECT_GT(n.dotProduct(box.getVertices()[i]), 0.0);
    }

    Transform t(Vector(5.0, 0.0), M_PI / 2.0);
    AABB aabb = box.createAABB(t);
    EXPECT_NEAR(aabb.min.x, 4.5, 1e-12);
    EXPECT_NEAR(aabb.max.x, 5.5, 1e-12);
    EXPECT_NEAR(aabb.min.y, -1.0, 1e-12);
    EXPECT_NEAR(aabb.max.y, 1.0, 1e-12);

    EXPECT_TRUE(box.contains(Vector(5.0, 0.9), t));
    EXPECT_FALSE(box.contains(Vector(5.9, 0.0), t));
}

TEST(ShapeTest, PolygonProjectionAndSupport) {
    Polygon box = Polygon::rectangle(2.0, 2.0);
    Transform t(Vector(1.0, 0.0), 0.0);

    Interval i = box.project(Vector(1.0, 0.0), t);
    EXPECT_NEAR(i.min, 0.0, 1e-12);
    EXPECT_NEAR(i.max, 2.0, 1e-12);

    Vector p = box.getFarthestPoint(Vector(1.0, 1.0), t);
    EXPECT_NEAR(p.x, 2.0, 1e-12);
    EXPECT_NEAR(p.y, 1.0, 1e-12);
}

TEST(ShapeTest, PolygonFarthestFeatureIsFacingEdge) {
    Polygon box = Polygon::rectangle(2.0, 2.0);
    Transform t;

    Feature f = box.getFarthestFeature(Vector(1.0, 0.1), t);
    ASSERT_TRUE(f.isEdge());
    // the right face, x = 1
    EXPECT_NEAR(f.vertex1.point.x, 1.0, 1e-12);
    EXPECT_NEAR(f.vertex2.point.x, 1.0, 1e-12);
    EXPECT_NEAR(f.max.point.y, 1.0, 1e-12);
    Vector e = f.edge;
    EXPECT_NEAR(std::fabs(e.y), 2.0, 1e-12);
}

TEST(ShapeTest, CircleQueries) {
    Circle c(0.5, Vector(1.0, 0.0));
    EXPECT_DOUBLE_EQ(c.getRadius(), 1.5);
    EXPECT_DOUBLE_EQ(c.getCircleRadius(), 0.5);

    Transform t(Vector(0.0, 0.0), M_PI);
    std::vector<Vector> foci = c.getFoci(t);
    ASSERT_EQ(foci.size(), 1u);
    EXPECT_NEAR(foci[0].x, -1.0, 1e-12);

    Interval i = c.project(Vector(0.0, 1.0), t);
    EXPECT_NEAR(i.min, -0.5, 1e-12);
    EXPECT_NEAR(i.max, 0.5, 1e-12);

    Feature f = c.getFarthestFeature(Vector(0.0, 1.0), t);
    EXPECT_FALSE(f.isEdge());
    EXPECT_NEAR(f.max.point.y, 0.5, 1e-12);

    EXPECT_TRUE(c.contains(Vector(-1.2, 0.0), t));
    EXPECT_FALSE(c.contains(Vector(1.0, 0.0), t));
}

TEST(ShapeTest, SegmentQueries) {
    Segment s(Vector(-1.0, 0.0), Vector(1.0, 0.0));
    Transform t;

    EXPECT_DOUBLE_EQ(s.getRadius(), 1.0);
    EXPECT_TRUE(s.contains(Vector(0.5, 0.0), t));
    EXPECT_FALSE(s.contains(Vector(0.5, 0.1), t));

    Feature f = s.getFarthestFeature(Vector(0.0, 1.0), t);
    EXPECT_TRUE(f.isEdge());

    Interval i = s.project(Vector(1.0, 0.0), t);
    EXPECT_NEAR(i.min, -1.0, 1e-12);
    EXPECT_NEAR(i.max, 1.0, 1e-12);
}

TEST(ShapeTest, CapsuleQueries) {
    Capsule cap(3.0, 1.0);
    Transform t;

    EXPECT_DOUBLE_EQ(cap.getCapRadius(), 0.5);
    EXPECT_DOUBLE_EQ(cap.getRadius(), 1.5);

    AABB aabb = cap.createAABB(t);
    EXPECT_NEAR(aabb.min.x, -1.5, 1e-12);
    EXPECT_NEAR(aabb.max.x, 1.5, 1e-12);
    EXPECT_NEAR(aabb.min.y, -0.5, 1e-12);
    EXPECT_NEAR(aabb.max.y, 0.5, 1e-12);

    Interval i = cap.project(Vector(1.0, 0.0), t);
    EXPECT_NEAR(i.min, -1.5, 1e-12);
    EXPECT_NEAR(i.max, 1.5, 1e-12);

    // along the long axis the cap is a point, across it the flat side is an edge
    EXPECT_FALSE(cap.getFarthestFeature(Vector(1.0, 0.0), t).isEdge());
    EXPECT_TRUE(cap.getFarthestFeature(Vector(0.0, 1.0), t).isEdge());

    EXPECT_TRUE(cap.contains(Vector(1.2, 0.0), t));
    EXPECT_FALSE(cap.contains(Vector(0.0, 0.6), t));
}
