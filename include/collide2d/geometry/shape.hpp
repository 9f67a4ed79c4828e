/**
 * @file shape.hpp
 * @brief Convex shape interface shared by every narrowphase algorithm
 *
 * Shapes are defined in body-local coordinates; every query takes the body
 * Transform. The interface is closed over four variants: Circle, Polygon,
 * Segment and Capsule.
 */

#ifndef COLLIDE2D_SHAPE_HPP
#define COLLIDE2D_SHAPE_HPP

#include <vector>
#include "collide2d/geometry/feature.hpp"
#include "collide2d/math/aabb.hpp"
#include "collide2d/math/interval.hpp"
#include "collide2d/math/transform.hpp"

namespace Geometry {

enum class ShapeType {
    Circle,
    Polygon,
    Segment,
    Capsule
};

/**
 * @class Shape
 * @brief Abstract convex shape
 */
class Shape {
public:
    virtual ~Shape() = default;

    virtual ShapeType getType() const = 0;

    /** @brief Local geometric center */
    virtual Vector getCenter() const = 0;

    /**
     * @brief Rotation disc radius
     *
     * Maximum distance from the body origin to any point of the shape. Used to
     * bound rotational sweep in conservative advancement.
     */
    virtual double getRadius() const = 0;

    /**
     * @brief Projects the shape onto a unit axis
     * @param axis World-space unit axis
     * @param transform Body transform
     */
    virtual Interval project(const Vector& axis, const Transform& transform) const = 0;

    /** @brief World-space support point along direction */
    virtual Vector getFarthestPoint(const Vector& direction, const Transform& transform) const = 0;

    /** @brief Vertex or edge most aligned with direction */
    virtual Feature getFarthestFeature(const Vector& direction, const Transform& transform) const = 0;

    /**
     * @brief Candidate separating axes
     *
     * Returns the shape's own axes plus, for each focus of the other shape, the
     * axis from this shape's closest point toward that focus. Entries may be
     * zero vectors; callers skip them.
     */
    virtual std::vector<Vector> getAxes(const std::vector<Vector>& foci, const Transform& transform) const = 0;

    /** @brief World-space focal points (circle centres, capsule cap centres) */
    virtual std::vector<Vector> getFoci(const Transform& transform) const = 0;

    virtual AABB createAABB(const Transform& transform) const = 0;

    /** @brief Point containment test (boundary included) */
    virtual bool contains(const Vector& point, const Transform& transform) const = 0;
};

} // namespace Geometry

#endif
