#ifndef COLLIDE2D_CIRCLE_HPP
#define COLLIDE2D_CIRCLE_HPP

#include "collide2d/geometry/shape.hpp"

namespace Geometry {

/**
 * @class Circle
 * @brief Circle of a given radius, optionally offset from the body origin
 */
class Circle : public Shape {
public:
    /**
     * @param radius Circle radius, must be positive
     * @param center Local offset of the circle center
     * @throws std::invalid_argument if radius <= 0
     */
    explicit Circle(double radius, const Vector& center = Vector(0.0, 0.0));

    ShapeType getType() const override { return ShapeType::Circle; }
    Vector getCenter() const override { return center; }
    double getRadius() const override;
    double getCircleRadius() const { return radius; }

    Interval project(const Vector& axis, const Transform& transform) const override;
    Vector getFarthestPoint(const Vector& direction, const Transform& transform) const override;
    Feature getFarthestFeature(const Vector& direction, const Transform& transform) const override;
    std::vector<Vector> getAxes(const std::vector<Vector>& foci, const Transform& transform) const override;
    std::vector<Vector> getFoci(const Transform& transform) const override;
    AABB createAABB(const Transform& transform) const override;
    bool contains(const Vector& point, const Transform& transform) const override;

private:
    double radius;
    Vector center;
};

} // namespace Geometry

#endif
