#include "collide2d/geometry/segment.hpp"

#include <algorithm>
#include <stdexcept>

namespace Geometry {

Segment::Segment(const Vector& p1, const Vector& p2) : p1(p1), p2(p2) {
  if ((p2 - p1).isZero()) {
    throw std::invalid_argument("Segment endpoints must differ");
  }
}

double Segment::getRadius() const {
  return std::max(p1.length(), p2.length());
}

Vector Segment::farthestPoint(const Vector& a, const Vector& b,
                              const Vector& direction, const Transform& transform) {
  Vector const wa = transform.apply(a);
  Vector const wb = transform.apply(b);
  return wa.dotProduct(direction) >= wb.dotProduct(direction) ? wa : wb;
}

Feature Segment::farthestFeature(const Vector& a, const Vector& b,
                                 const Vector& direction, const Transform& transform) {
  Vertex const v1{transform.apply(a), 0};
  Vertex const v2{transform.apply(b), 1};
  Vertex const max = v1.point.dotProduct(direction) >= v2.point.dotProduct(direction) ? v1 : v2;
  return Feature::makeEdge(v1, v2, max, 0);
}

Interval Segment::project(const Vector& axis, const Transform& transform) const {
  double const a = transform.apply(p1).dotProduct(axis);
  double const b = transform.apply(p2).dotProduct(axis);
  return {std::min(a, b), std::max(a, b)};
}

Vector Segment::getFarthestPoint(const Vector& direction, const Transform& transform) const {
  return farthestPoint(p1, p2, direction, transform);
}

Feature Segment::getFarthestFeature(const Vector& direction, const Transform& transform) const {
  return farthestFeature(p1, p2, direction, transform);
}

std::vector<Vector> Segment::getAxes(const std::vector<Vector>& foci, const Transform& transform) const {
  std::vector<Vector> axes;
  axes.reserve(2 + foci.size());

  Vector const w1 = transform.apply(p1);
  Vector const w2 = transform.apply(p2);
  Vector const edge = (w2 - w1).normalized();
  axes.push_back(edge.rightPerp());
  axes.push_back(edge);

  for (const auto& f : foci) {
    Vector const axis = w1.distanceSquared(f) < w2.distanceSquared(f) ? f - w1 : f - w2;
    axes.push_back(axis.isZero() ? axis : axis.normalized());
  }
  return axes;
}

std::vector<Vector> Segment::getFoci(const Transform& /*transform*/) const {
  return {};
}

AABB Segment::createAABB(const Transform& transform) const {
  Vector const a = transform.apply(p1);
  Vector const b = transform.apply(p2);
  return {std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
}

bool Segment::contains(const Vector& point, const Transform& transform) const {
  Vector const a = transform.apply(p1);
  Vector const b = transform.apply(p2);
  return closestPointOnLine(a, b, point).distanceSquared(point) <= EPSILON * EPSILON;
}

} // namespace Geometry
