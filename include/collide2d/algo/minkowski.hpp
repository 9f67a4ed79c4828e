/**
 * @file minkowski.hpp
 * @brief Support mapping of the Minkowski difference A - B
 *
 * GJK and EPA never build A - B explicitly; they only ask for its farthest
 * point along a direction, which is support(A, d) - support(B, -d).
 */

#ifndef COLLIDE2D_MINKOWSKI_HPP
#define COLLIDE2D_MINKOWSKI_HPP

#include "collide2d/geometry/shape.hpp"

/** Support point of A - B together with the two shape points that produced it */
struct MinkowskiPoint {
    Vector supportPoint1;
    Vector supportPoint2;
    Vector point;
};

class MinkowskiSum {
public:
    MinkowskiSum(const Geometry::Shape& a, const Transform& ta,
                 const Geometry::Shape& b, const Transform& tb)
        : a(a), ta(ta), b(b), tb(tb) {}

    Vector support(const Vector& direction) const {
        return a.getFarthestPoint(direction, ta) - b.getFarthestPoint(-direction, tb);
    }

    MinkowskiPoint supportPoint(const Vector& direction) const {
        MinkowskiPoint p;
        p.supportPoint1 = a.getFarthestPoint(direction, ta);
        p.supportPoint2 = b.getFarthestPoint(-direction, tb);
        p.point = p.supportPoint1 - p.supportPoint2;
        return p;
    }

private:
    const Geometry::Shape& a;
    const Transform& ta;
    const Geometry::Shape& b;
    const Transform& tb;
};

#endif
