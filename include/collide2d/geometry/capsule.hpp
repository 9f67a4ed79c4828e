#ifndef COLLIDE2D_CAPSULE_HPP
#define COLLIDE2D_CAPSULE_HPP

#include "collide2d/geometry/shape.hpp"

namespace Geometry {

/**
 * @class Capsule
 * @brief Rectangle with semicircular caps on the longer dimension
 *
 * Centred on the body origin. Behaves as a segment between the two cap
 * centres expanded by the cap radius.
 */
class Capsule : public Shape {
public:
    /**
     * @param width Bounding width
     * @param height Bounding height
     * @throws std::invalid_argument for non-positive or equal dimensions
     */
    Capsule(double width, double height);

    ShapeType getType() const override { return ShapeType::Capsule; }
    Vector getCenter() const override { return {0.0, 0.0}; }
    double getRadius() const override { return length * 0.5; }
    double getCapRadius() const { return capRadius; }

    Interval project(const Vector& axis, const Transform& transform) const override;
    Vector getFarthestPoint(const Vector& direction, const Transform& transform) const override;
    Feature getFarthestFeature(const Vector& direction, const Transform& transform) const override;
    std::vector<Vector> getAxes(const std::vector<Vector>& foci, const Transform& transform) const override;
    std::vector<Vector> getFoci(const Transform& transform) const override;
    AABB createAABB(const Transform& transform) const override;
    bool contains(const Vector& point, const Transform& transform) const override;

private:
    double length;      ///< length of the major axis
    double capRadius;
    Vector focus1;
    Vector focus2;
    Vector localXAxis;
};

} // namespace Geometry

#endif
