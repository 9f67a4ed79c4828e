#include "collide2d/algo/gjk.hpp"
#include "collide2d/algo/minkowski.hpp"
#include "collide2d/geometry/circle.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

// termination tolerance for distance and raycast refinement
const double DISTANCE_EPSILON = std::sqrt(EPSILON);

bool isCircle(const Geometry::Shape& s) {
    return s.getType() == Geometry::ShapeType::Circle;
}

// Evolves the simplex toward the origin. Returns true once the triangle
// encloses the origin; otherwise drops the redundant point and updates the
// search direction.
bool handleSimplex(Simplex& simplex, Vector& direction) {
    const auto& pts = simplex.points;
    Vector const a = pts.back();
    Vector const ao = -a;

    if (pts.size() == 3) {
        Vector const b = pts[1];
        Vector const c = pts[0];
        Vector const ab = b - a;
        Vector const ac = c - a;

        Vector const acPerp = tripleProduct(ab, ac, ac);
        if (acPerp.dotProduct(ao) >= 0.0) {
            // origin beyond AC, drop B
            simplex.points.erase(simplex.points.begin() + 1);
            direction = acPerp;
            return false;
        }

        Vector const abPerp = tripleProduct(ac, ab, ab);
        if (abPerp.dotProduct(ao) < 0.0) {
            return true;
        }
        // origin beyond AB, drop C
        simplex.points.erase(simplex.points.begin());
        direction = abPerp;
        return false;
    }

    Vector const b = pts[0];
    Vector const ab = b - a;
    direction = tripleProduct(ab, ao, ab);
    if (direction.lengthSquared() <= EPSILON) {
        // origin lies on the line through AB
        direction = ab.perp();
    }
    return false;
}

// Closest point to the origin on segment ab
Vector closestToOrigin(const Vector& a, const Vector& b) {
    return closestPointOnLine(a, b, Vector(0.0, 0.0));
}

bool containsOrigin(const Vector& a, const Vector& b, const Vector& c) {
    double const sa = a.cross(b);
    double const sb = b.cross(c);
    double const sc = c.cross(a);
    return sa * sb > 0.0 && sa * sc > 0.0;
}

// Interpolates the shape points behind the closest point of segment ab
void findClosestPoints(const MinkowskiPoint& a, const MinkowskiPoint& b, Separation& separation) {
    Vector const l = b.point - a.point;
    if (l.isZero()) {
        separation.point1 = a.supportPoint1;
        separation.point2 = a.supportPoint2;
        return;
    }

    double const ll = l.dotProduct(l);
    double const l2 = -l.dotProduct(a.point) / ll;
    double const l1 = 1.0 - l2;

    if (l1 < 0.0) {
        separation.point1 = b.supportPoint1;
        separation.point2 = b.supportPoint2;
    } else if (l2 < 0.0) {
        separation.point1 = a.supportPoint1;
        separation.point2 = a.supportPoint2;
    } else {
        separation.point1 = a.supportPoint1 * l1 + b.supportPoint1 * l2;
        separation.point2 = a.supportPoint2 * l1 + b.supportPoint2 * l2;
    }
}

} // namespace

bool GJKIntersect(const Geometry::Shape* a, const Transform& ta,
                  const Geometry::Shape* b, const Transform& tb,
                  Simplex& simplex, int maxIterations)
{
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("GJKIntersect: shape must not be null");
    }

    MinkowskiSum const ms(*a, ta, *b, tb);

    Vector direction = tb.apply(b->getCenter()) - ta.apply(a->getCenter());
    if (direction.isZero()) {
        direction = Vector(1.0, 0.0);
    }

    simplex.points.clear();
    simplex.points.push_back(ms.support(direction));
    if (simplex.points[0].dotProduct(direction) <= 0.0) {
        return false;
    }
    direction = -direction;

    for (int i = 0; i < maxIterations; ++i) {
        Vector const p = ms.support(direction);
        if (p.dotProduct(direction) <= EPSILON) {
            // the new point did not pass the origin
            return false;
        }
        simplex.points.push_back(p);
        if (handleSimplex(simplex, direction)) {
            return true;
        }
    }

    std::cerr << "Warning: GJK exceeded max iterations. Assuming no collision." << std::endl;
    return false;
}

bool circleDistance(const Geometry::Shape& a, const Transform& ta,
                    const Geometry::Shape& b, const Transform& tb,
                    Separation& separation)
{
    const auto& ca = static_cast<const Geometry::Circle&>(a);
    const auto& cb = static_cast<const Geometry::Circle&>(b);

    Vector const c1 = ta.apply(ca.getCenter());
    Vector const c2 = tb.apply(cb.getCenter());
    Vector const v = c2 - c1;
    double const mag = v.length();
    double const radii = ca.getCircleRadius() + cb.getCircleRadius();

    if (mag <= radii || mag <= EPSILON) {
        return false;
    }

    Vector const n = v / mag;
    separation.normal = n;
    separation.distance = mag - radii;
    separation.point1 = c1 + n * ca.getCircleRadius();
    separation.point2 = c2 - n * cb.getCircleRadius();
    return true;
}

bool GJKDistance(const Geometry::Shape* a, const Transform& ta,
                 const Geometry::Shape* b, const Transform& tb,
                 Separation& separation, int maxIterations)
{
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("GJKDistance: shape must not be null");
    }
    if (isCircle(*a) && isCircle(*b)) {
        return circleDistance(*a, ta, *b, tb, separation);
    }

    MinkowskiSum const ms(*a, ta, *b, tb);

    Vector d = tb.apply(b->getCenter()) - ta.apply(a->getCenter());
    if (d.isZero()) {
        return false;
    }

    MinkowskiPoint pa = ms.supportPoint(d);
    d = -d;
    MinkowskiPoint pb = ms.supportPoint(d);
    d = closestToOrigin(pb.point, pa.point);

    MinkowskiPoint pc;
    for (int i = 0; i < maxIterations; ++i) {
        d = -d;
        if (d.lengthSquared() <= EPSILON) {
            // origin on the segment: touching or overlapping
            return false;
        }
        d = d.normalized();

        pc = ms.supportPoint(d);
        if (containsOrigin(pa.point, pb.point, pc.point)) {
            return false;
        }

        double const projection = pc.point.dotProduct(d);
        if (projection - pa.point.dotProduct(d) < DISTANCE_EPSILON) {
            if (projection >= 0.0) {
                // the support plane does not separate the origin: shallow overlap
                return false;
            }
            separation.normal = d;
            separation.distance = -projection;
            findClosestPoints(pa, pb, separation);
            return true;
        }

        Vector const p1 = closestToOrigin(pa.point, pc.point);
        Vector const p2 = closestToOrigin(pc.point, pb.point);
        if (p1.lengthSquared() < p2.lengthSquared()) {
            pb = pc;
            d = p1;
        } else {
            pa = pc;
            d = p2;
        }
    }

    // out of iterations: d is the closest point found so far, accepted only
    // while a support plane along it still separates the origin
    Vector const n = (-d).normalized();
    if (ms.supportPoint(-d).point.dotProduct(n) >= 0.0) {
        return false;
    }
    separation.normal = n;
    separation.distance = d.length();
    findClosestPoints(pa, pb, separation);
    return true;
}

bool circleRaycast(const Geometry::Ray& ray, double maxLength,
                   const Geometry::Shape& circle, const Transform& transform,
                   RaycastResult& result)
{
    const auto& c = static_cast<const Geometry::Circle&>(circle);
    if (c.contains(ray.start, transform)) {
        return false;
    }

    Vector const center = transform.apply(c.getCenter());
    Vector const d = ray.direction;
    Vector const sc = ray.start - center;
    double const r = c.getCircleRadius();

    double const qa = d.dotProduct(d);
    double const qb = 2.0 * d.dotProduct(sc);
    double const qc = sc.dotProduct(sc) - r * r;
    double const disc = qb * qb - 4.0 * qa * qc;
    if (disc < 0.0) {
        return false;
    }

    double const root = std::sqrt(disc);
    double const inv2a = 1.0 / (2.0 * qa);
    double const t0 = (-qb + root) * inv2a;
    double const t1 = (-qb - root) * inv2a;

    double t = 0.0;
    if (t0 < 0.0) {
        if (t1 < 0.0) {
            return false;
        }
        t = t1;
    } else {
        t = t1 < 0.0 ? t0 : std::min(t0, t1);
    }
    if (maxLength > 0.0 && t > maxLength) {
        return false;
    }

    result.point = ray.start + d * t;
    result.normal = (result.point - center).normalized();
    result.distance = t;
    return true;
}

bool GJKRaycast(const Geometry::Ray& ray, double maxLength,
                const Geometry::Shape* shape, const Transform& transform,
                RaycastResult& result, int maxIterations)
{
    if (shape == nullptr) {
        throw std::invalid_argument("GJKRaycast: shape must not be null");
    }
    if (isCircle(*shape)) {
        return circleRaycast(ray, maxLength, *shape, transform, result);
    }
    if (shape->contains(ray.start, transform)) {
        return false;
    }

    bool const lengthCheck = maxLength > 0.0;
    const Vector& start = ray.start;
    const Vector& r = ray.direction;

    double lambda = 0.0;
    Vector x = start;
    Vector n;
    // from the shape centre toward the ray start
    Vector d = x - transform.apply(shape->getCenter());

    bool haveA = false;
    bool haveB = false;
    Vector a;
    Vector b;

    double distanceSqrd = std::numeric_limits<double>::max();
    int iterations = 0;
    while (distanceSqrd > DISTANCE_EPSILON) {
        Vector const p = shape->getFarthestPoint(d, transform);
        Vector const w = x - p;
        double const dDotW = d.dotProduct(w);
        if (dDotW > 0.0) {
            double const dDotR = d.dotProduct(r);
            if (dDotR >= 0.0) {
                return false;
            }
            // advance x along the ray to the support plane
            lambda -= dDotW / dDotR;
            if (lengthCheck && lambda > maxLength) {
                return false;
            }
            x = start + r * lambda;
            n = d;
        }

        if (haveA) {
            if (haveB) {
                Vector const p1 = closestPointOnLine(a, p, x);
                Vector const p2 = closestPointOnLine(p, b, x);
                if (p1.distanceSquared(x) < p2.distanceSquared(x)) {
                    b = p;
                    distanceSqrd = p1.distanceSquared(x);
                } else {
                    a = p;
                    distanceSqrd = p2.distanceSquared(x);
                }
            } else {
                b = p;
                haveB = true;
            }
            Vector const ab = b - a;
            Vector const ax = x - a;
            d = tripleProduct(ab, ax, ab);
        } else {
            a = p;
            haveA = true;
            d = -d;
        }

        if (iterations == maxIterations) {
            return false;
        }
        iterations++;
    }

    if (n.isZero()) {
        return false;
    }
    result.point = x;
    result.normal = n.normalized();
    result.distance = lambda;
    return true;
}
