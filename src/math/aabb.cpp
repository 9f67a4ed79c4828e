#include "collide2d/math/aabb.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

AABB::AABB(const Vector& min, const Vector& max) : min(min), max(max) {}

AABB::AABB(double minX, double minY, double maxX, double maxY)
    : min(minX, minY), max(maxX, maxY) {}

AABB AABB::combine(const AABB& a, const AABB& b) {
  return {std::min(a.min.x, b.min.x), std::min(a.min.y, b.min.y),
          std::max(a.max.x, b.max.x), std::max(a.max.y, b.max.y)};
}

bool AABB::overlaps(const AABB& other) const {
  if (min.x > other.max.x || other.min.x > max.x) return false;
  if (min.y > other.max.y || other.min.y > max.y) return false;
  return true;
}

bool AABB::contains(const AABB& other) const {
  return min.x <= other.min.x && min.y <= other.min.y &&
         max.x >= other.max.x && max.y >= other.max.y;
}

bool AABB::contains(const Vector& point) const {
  return point.x >= min.x && point.x <= max.x &&
         point.y >= min.y && point.y <= max.y;
}

AABB AABB::expand(double margin) const {
  return {min.x - margin, min.y - margin, max.x + margin, max.y + margin};
}

AABB AABB::sweep(const Vector& displacement) const {
  AABB out = *this;
  if (displacement.x < 0.0) out.min.x += displacement.x;
  else out.max.x += displacement.x;
  if (displacement.y < 0.0) out.min.y += displacement.y;
  else out.max.y += displacement.y;
  return out;
}

double AABB::perimeter() const {
  return 2.0 * ((max.x - min.x) + (max.y - min.y));
}

Vector AABB::getCenter() const {
  return {(min.x + max.x) * 0.5, (min.y + max.y) * 0.5};
}

bool AABB::intersectsRay(const Vector& start, const Vector& direction, double length) const {
  double tmin = 0.0;
  double tmax = length;

  double const s[2] = {start.x, start.y};
  double const d[2] = {direction.x, direction.y};
  double const lo[2] = {min.x, min.y};
  double const hi[2] = {max.x, max.y};

  for (int i = 0; i < 2; ++i) {
    if (std::fabs(d[i]) <= EPSILON) {
      // parallel to this slab
      if (s[i] < lo[i] || s[i] > hi[i]) {
        return false;
      }
      continue;
    }
    double const inv = 1.0 / d[i];
    double t1 = (lo[i] - s[i]) * inv;
    double t2 = (hi[i] - s[i]) * inv;
    if (t1 > t2) std::swap(t1, t2);
    tmin = std::max(tmin, t1);
    tmax = std::min(tmax, t2);
    if (tmin > tmax) {
      return false;
    }
  }
  return true;
}
