/**
 * @file polygon.hpp
 * @brief Convex polygon shape
 *
 * Stores vertices in local space (relative to the body origin) in
 * counter-clockwise order along with the outward edge normals. normals[i]
 * belongs to the edge vertices[i] -> vertices[i + 1].
 */

#ifndef COLLIDE2D_POLYGON_HPP
#define COLLIDE2D_POLYGON_HPP

#include <vector>
#include "collide2d/geometry/shape.hpp"

namespace Geometry {

class Polygon : public Shape {
public:
    /**
     * @param vertices Local vertices, counter-clockwise, strictly convex
     * @throws std::invalid_argument for fewer than 3 vertices, clockwise winding
     *         or a non-convex outline
     */
    explicit Polygon(std::vector<Vector> vertices);

    /** @brief Axis-aligned rectangle centred on the body origin */
    static Polygon rectangle(double width, double height);

    ShapeType getType() const override { return ShapeType::Polygon; }
    Vector getCenter() const override { return center; }
    double getRadius() const override { return radius; }

    const std::vector<Vector>& getVertices() const { return vertices; }
    const std::vector<Vector>& getNormals() const { return normals; }

    Interval project(const Vector& axis, const Transform& transform) const override;
    Vector getFarthestPoint(const Vector& direction, const Transform& transform) const override;
    Feature getFarthestFeature(const Vector& direction, const Transform& transform) const override;
    std::vector<Vector> getAxes(const std::vector<Vector>& foci, const Transform& transform) const override;
    std::vector<Vector> getFoci(const Transform& transform) const override;
    AABB createAABB(const Transform& transform) const override;
    bool contains(const Vector& point, const Transform& transform) const override;

private:
    /** @brief Index of the local vertex farthest along a local direction */
    int farthestVertexIndex(const Vector& localDirection) const;

    std::vector<Vector> vertices;
    std::vector<Vector> normals;
    Vector center;
    double radius;
};

} // namespace Geometry

#endif
