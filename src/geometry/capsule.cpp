#include "collide2d/geometry/capsule.hpp"
#include "collide2d/geometry/segment.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Geometry {

namespace {
// cosine above which a direction counts as aligned with a flat side
constexpr double EDGE_SELECTION_CRITERIA = 0.98;
// the flat sides are stretched slightly so edge clipping still overlaps near the caps
constexpr double EDGE_EXPANSION_FACTOR = 0.1;
}

Capsule::Capsule(double width, double height) {
  if (width <= 0.0 || height <= 0.0) {
    throw std::invalid_argument("Capsule dimensions must be positive");
  }
  if (nearlyEqual(width, height)) {
    throw std::invalid_argument("Capsule width and height must differ, use a Circle instead");
  }

  bool const vertical = width < height;
  double const major = vertical ? height : width;
  double const minor = vertical ? width : height;

  length = major;
  capRadius = minor * 0.5;
  localXAxis = vertical ? Vector(0.0, 1.0) : Vector(1.0, 0.0);

  double const f = major * 0.5 - capRadius;
  focus1 = localXAxis * -f;
  focus2 = localXAxis * f;
}

Interval Capsule::project(const Vector& axis, const Transform& transform) const {
  Vector const p = getFarthestPoint(axis, transform);
  double const c = transform.getTranslation().dotProduct(axis);
  double const d = p.dotProduct(axis);
  return {2.0 * c - d, d};
}

Vector Capsule::getFarthestPoint(const Vector& direction, const Transform& transform) const {
  Vector const n = direction.normalized();
  return Segment::farthestPoint(focus1, focus2, n, transform) + n * capRadius;
}

Feature Capsule::getFarthestFeature(const Vector& direction, const Transform& transform) const {
  Vector const local = transform.inverseRotation(direction);
  Vector const n1 = localXAxis.perp();

  double const d = local.lengthSquared() * EDGE_SELECTION_CRITERIA;
  double const d1 = local.dotProduct(n1);

  if (std::fabs(d1) < d) {
    return Feature::point(getFarthestPoint(direction, transform), 0);
  }

  Vector const v = n1 * capRadius;
  Vector const e = localXAxis * (length * 0.5 * EDGE_EXPANSION_FACTOR);
  if (d1 > 0.0) {
    return Segment::farthestFeature(focus1 + v - e, focus2 + v + e, direction, transform);
  }
  return Segment::farthestFeature(focus1 - v - e, focus2 - v + e, direction, transform);
}

std::vector<Vector> Capsule::getAxes(const std::vector<Vector>& foci, const Transform& transform) const {
  std::vector<Vector> axes;
  axes.reserve(2 + foci.size());
  axes.push_back(transform.applyRotation(localXAxis));
  axes.push_back(transform.applyRotation(localXAxis.rightPerp()));

  Vector const f1 = transform.apply(focus1);
  Vector const f2 = transform.apply(focus2);
  for (const auto& f : foci) {
    Vector const axis = f1.distanceSquared(f) < f2.distanceSquared(f) ? f - f1 : f - f2;
    axes.push_back(axis.isZero() ? axis : axis.normalized());
  }
  return axes;
}

std::vector<Vector> Capsule::getFoci(const Transform& transform) const {
  return {transform.apply(focus1), transform.apply(focus2)};
}

AABB Capsule::createAABB(const Transform& transform) const {
  Vector const a = transform.apply(focus1);
  Vector const b = transform.apply(focus2);
  return AABB(std::min(a.x, b.x), std::min(a.y, b.y),
              std::max(a.x, b.x), std::max(a.y, b.y)).expand(capRadius);
}

bool Capsule::contains(const Vector& point, const Transform& transform) const {
  Vector const a = transform.apply(focus1);
  Vector const b = transform.apply(focus2);
  return closestPointOnLine(a, b, point).distanceSquared(point) <= capRadius * capRadius;
}

} // namespace Geometry
