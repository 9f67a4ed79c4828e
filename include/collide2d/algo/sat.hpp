/**
 * @file sat.hpp
 * @brief Separating Axis Theorem overlap test for convex shapes
 */

#ifndef COLLIDE2D_SAT_HPP
#define COLLIDE2D_SAT_HPP

#include "collide2d/algo/collision_results.hpp"
#include "collide2d/geometry/shape.hpp"

/**
 * @brief Tests two shapes for overlap and computes the minimum translation
 *
 * Candidate axes are A's axes toward B's foci followed by B's axes toward
 * A's foci. The first separating axis ends the test. Otherwise the axis of
 * least overlap becomes the normal, oriented from A's centre toward B's.
 * Circle pairs use the closed form.
 *
 * @throws std::invalid_argument if either shape is null
 * @return true and fills penetration when the shapes overlap
 */
bool SATDetect(const Geometry::Shape* a, const Transform& ta,
               const Geometry::Shape* b, const Transform& tb,
               Penetration& penetration);

/** @brief Boolean-only variant; stops at the first separating axis */
bool SATDetect(const Geometry::Shape* a, const Transform& ta,
               const Geometry::Shape* b, const Transform& tb);

/**
 * @brief Closed-form circle overlap
 *
 * Overlap requires |c2 - c1| < r1 + r2. Coincident centres use the +x normal.
 */
bool circleDetect(const Geometry::Shape& a, const Transform& ta,
                  const Geometry::Shape& b, const Transform& tb,
                  Penetration& penetration);

#endif
