#include "collide2d/algo/sat.hpp"
#include "collide2d/geometry/circle.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

void requireShapes(const Geometry::Shape* a, const Geometry::Shape* b) {
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("SATDetect: shape must not be null");
    }
}

bool bothCircles(const Geometry::Shape& a, const Geometry::Shape& b) {
    return a.getType() == Geometry::ShapeType::Circle && b.getType() == Geometry::ShapeType::Circle;
}

// Tests one batch of axes, keeping the least overlap seen so far.
// Returns false as soon as a separating axis is found.
bool testAxes(const std::vector<Vector>& axes,
              const Geometry::Shape& a, const Transform& ta,
              const Geometry::Shape& b, const Transform& tb,
              double& minOverlap, Vector& bestAxis)
{
    for (Vector axis : axes) {
        if (axis.isZero()) {
            continue;
        }
        Interval const ia = a.project(axis, ta);
        Interval const ib = b.project(axis, tb);
        if (!ia.overlaps(ib)) {
            return false;
        }

        double o = ia.getOverlap(ib);
        if (ia.containsExclusive(ib) || ib.containsExclusive(ia)) {
            // push out through the nearer end
            double const maxDist = std::fabs(ia.max - ib.max);
            double const minDist = std::fabs(ia.min - ib.min);
            if (maxDist > minDist) {
                axis = -axis;
                o += minDist;
            } else {
                o += maxDist;
            }
        }

        if (o < minOverlap) {
            minOverlap = o;
            bestAxis = axis;
        }
    }
    return true;
}

} // namespace

bool circleDetect(const Geometry::Shape& a, const Transform& ta,
                  const Geometry::Shape& b, const Transform& tb,
                  Penetration& penetration)
{
    const auto& ca = static_cast<const Geometry::Circle&>(a);
    const auto& cb = static_cast<const Geometry::Circle&>(b);

    Vector const c1 = ta.apply(ca.getCenter());
    Vector const c2 = tb.apply(cb.getCenter());
    Vector const v = c2 - c1;
    double const radii = ca.getCircleRadius() + cb.getCircleRadius();
    double const mag = v.length();

    if (mag >= radii) {
        return false;
    }

    penetration.normal = mag > EPSILON ? v / mag : Vector(1.0, 0.0);
    penetration.depth = radii - mag;
    return true;
}

bool SATDetect(const Geometry::Shape* a, const Transform& ta,
               const Geometry::Shape* b, const Transform& tb,
               Penetration& penetration)
{
    requireShapes(a, b);
    if (bothCircles(*a, *b)) {
        return circleDetect(*a, ta, *b, tb, penetration);
    }

    std::vector<Vector> const fociA = a->getFoci(ta);
    std::vector<Vector> const fociB = b->getFoci(tb);

    double minOverlap = std::numeric_limits<double>::max();
    Vector n;

    if (!testAxes(a->getAxes(fociB, ta), *a, ta, *b, tb, minOverlap, n)) {
        return false;
    }
    if (!testAxes(b->getAxes(fociA, tb), *a, ta, *b, tb, minOverlap, n)) {
        return false;
    }

    // every axis was degenerate
    if (minOverlap == std::numeric_limits<double>::max()) {
        return false;
    }

    Vector const c1 = ta.apply(a->getCenter());
    Vector const c2 = tb.apply(b->getCenter());
    if ((c2 - c1).dotProduct(n) < 0.0) {
        n = -n;
    }

    penetration.normal = n;
    penetration.depth = minOverlap;
    return true;
}

bool SATDetect(const Geometry::Shape* a, const Transform& ta,
               const Geometry::Shape* b, const Transform& tb)
{
    requireShapes(a, b);
    Penetration ignored;
    if (bothCircles(*a, *b)) {
        return circleDetect(*a, ta, *b, tb, ignored);
    }

    std::vector<Vector> const fociA = a->getFoci(ta);
    std::vector<Vector> const fociB = b->getFoci(tb);

    for (const auto& axes : {a->getAxes(fociB, ta), b->getAxes(fociA, tb)}) {
        for (const auto& axis : axes) {
            if (axis.isZero()) {
                continue;
            }
            if (!a->project(axis, ta).overlaps(b->project(axis, tb))) {
                return false;
            }
        }
    }
    return true;
}
