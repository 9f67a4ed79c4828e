/**
 * @file gjk.hpp
 * @brief Gilbert-Johnson-Keerthi queries on the Minkowski difference
 *
 * - GJKIntersect: boolean overlap, leaving the terminating simplex for EPA
 * - GJKDistance: separation distance and closest points of disjoint shapes
 * - GJKRaycast: first hit of a ray against a shape
 */

#ifndef COLLIDE2D_GJK_HPP
#define COLLIDE2D_GJK_HPP

#include <vector>
#include "collide2d/algo/collision_results.hpp"
#include "collide2d/geometry/ray.hpp"
#include "collide2d/geometry/shape.hpp"

struct Simplex {
    std::vector<Vector> points;
};

constexpr int GJK_DEFAULT_MAX_ITERATIONS = 30;

/**
 * @brief Overlap test
 * @param simplex Receives the enclosing triangle when the result is true
 * @throws std::invalid_argument if either shape is null
 */
bool GJKIntersect(const Geometry::Shape* a, const Transform& ta,
                  const Geometry::Shape* b, const Transform& tb,
                  Simplex& simplex, int maxIterations = GJK_DEFAULT_MAX_ITERATIONS);

/**
 * @brief Distance between two shapes
 *
 * @return false when the shapes overlap or their centres coincide, true with
 *         a filled separation otherwise
 * @throws std::invalid_argument if either shape is null
 */
bool GJKDistance(const Geometry::Shape* a, const Transform& ta,
                 const Geometry::Shape* b, const Transform& tb,
                 Separation& separation, int maxIterations = GJK_DEFAULT_MAX_ITERATIONS);

/**
 * @brief Casts a ray against a shape
 *
 * A ray starting inside the shape reports no hit.
 *
 * @param maxLength Maximum hit distance, <= 0 for unbounded
 * @throws std::invalid_argument if shape is null
 */
bool GJKRaycast(const Geometry::Ray& ray, double maxLength,
                const Geometry::Shape* shape, const Transform& transform,
                RaycastResult& result, int maxIterations = GJK_DEFAULT_MAX_ITERATIONS);

/** @brief Closed-form ray against circle */
bool circleRaycast(const Geometry::Ray& ray, double maxLength,
                   const Geometry::Shape& circle, const Transform& transform,
                   RaycastResult& result);

/** @brief Closed-form circle separation, false when overlapping */
bool circleDistance(const Geometry::Shape& a, const Transform& ta,
                    const Geometry::Shape& b, const Transform& tb,
                    Separation& separation);

#endif
