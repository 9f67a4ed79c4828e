#ifndef COLLIDE2D_SEGMENT_HPP
#define COLLIDE2D_SEGMENT_HPP

#include "collide2d/geometry/shape.hpp"

namespace Geometry {

/**
 * @class Segment
 * @brief Zero-thickness line segment between two local points
 *
 * The farthest feature of a segment is always the segment itself.
 */
class Segment : public Shape {
public:
    /**
     * @throws std::invalid_argument if the endpoints coincide
     */
    Segment(const Vector& p1, const Vector& p2);

    ShapeType getType() const override { return ShapeType::Segment; }
    Vector getCenter() const override { return (p1 + p2) * 0.5; }
    double getRadius() const override;

    const Vector& getPoint1() const { return p1; }
    const Vector& getPoint2() const { return p2; }

    Interval project(const Vector& axis, const Transform& transform) const override;
    Vector getFarthestPoint(const Vector& direction, const Transform& transform) const override;
    Feature getFarthestFeature(const Vector& direction, const Transform& transform) const override;
    std::vector<Vector> getAxes(const std::vector<Vector>& foci, const Transform& transform) const override;
    std::vector<Vector> getFoci(const Transform& transform) const override;
    AABB createAABB(const Transform& transform) const override;
    bool contains(const Vector& point, const Transform& transform) const override;

    /**
     * @brief Edge feature of the local segment a -> b
     *
     * Shared with Capsule, whose flat sides are segments.
     */
    static Feature farthestFeature(const Vector& a, const Vector& b,
                                   const Vector& direction, const Transform& transform);

    /** @brief World-space endpoint of local segment a -> b farthest along direction */
    static Vector farthestPoint(const Vector& a, const Vector& b,
                                const Vector& direction, const Transform& transform);

private:
    Vector p1;
    Vector p2;
};

} // namespace Geometry

#endif
