#include "collide2d/geometry/circle.hpp"

#include <stdexcept>

namespace Geometry {

Circle::Circle(double radius, const Vector& center) : radius(radius), center(center) {
  if (radius <= 0.0) {
    throw std::invalid_argument("Circle radius must be positive");
  }
}

double Circle::getRadius() const {
  return center.length() + radius;
}

Interval Circle::project(const Vector& axis, const Transform& transform) const {
  double const c = transform.apply(center).dotProduct(axis);
  return {c - radius, c + radius};
}

Vector Circle::getFarthestPoint(const Vector& direction, const Transform& transform) const {
  Vector const n = direction.normalized();
  return transform.apply(center) + n * radius;
}

Feature Circle::getFarthestFeature(const Vector& direction, const Transform& transform) const {
  return Feature::point(getFarthestPoint(direction, transform), 0);
}

std::vector<Vector> Circle::getAxes(const std::vector<Vector>& foci, const Transform& transform) const {
  std::vector<Vector> axes;
  axes.reserve(foci.size());
  Vector const c = transform.apply(center);
  for (const auto& f : foci) {
    Vector const axis = f - c;
    axes.push_back(axis.isZero() ? axis : axis.normalized());
  }
  return axes;
}

std::vector<Vector> Circle::getFoci(const Transform& transform) const {
  return {transform.apply(center)};
}

AABB Circle::createAABB(const Transform& transform) const {
  Vector const c = transform.apply(center);
  return {c.x - radius, c.y - radius, c.x + radius, c.y + radius};
}

bool Circle::contains(const Vector& point, const Transform& transform) const {
  return transform.apply(center).distanceSquared(point) <= radius * radius;
}

} // namespace Geometry
