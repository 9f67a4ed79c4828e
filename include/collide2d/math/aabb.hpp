/**
 * @file aabb.hpp
 * @brief Axis-aligned bounding box used by the broadphase tree
 */

#ifndef COLLIDE2D_AABB_HPP
#define COLLIDE2D_AABB_HPP

#include "collide2d/math/vector_math.hpp"

/**
 * @brief Axis-aligned bounds with min <= max on both axes
 */
struct AABB {
    Vector min;
    Vector max;

    AABB() = default;
    AABB(const Vector& min, const Vector& max);
    AABB(double minX, double minY, double maxX, double maxY);

    /** @brief Smallest box enclosing both */
    static AABB combine(const AABB& a, const AABB& b);

    bool overlaps(const AABB& other) const;

    /** @brief True when other lies inside this (boundaries included) */
    bool contains(const AABB& other) const;

    bool contains(const Vector& point) const;

    /** @brief Grows every side by margin */
    AABB expand(double margin) const;

    /** @brief Extends the box in the direction of a displacement */
    AABB sweep(const Vector& displacement) const;

    /** @brief Perimeter, the 2D surface area heuristic */
    double perimeter() const;

    Vector getCenter() const;
    double getWidth() const { return max.x - min.x; }
    double getHeight() const { return max.y - min.y; }

    /**
     * @brief Slab test of the segment start + t*direction, t in [0, length]
     */
    bool intersectsRay(const Vector& start, const Vector& direction, double length) const;
};

#endif
