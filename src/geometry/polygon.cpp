#include "collide2d/geometry/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace Geometry {

Polygon::Polygon(std::vector<Vector> verts) : vertices(std::move(verts)), radius(0.0) {
  const std::size_t n = vertices.size();
  if (n < 3) {
    throw std::invalid_argument("Polygon requires at least 3 vertices");
  }

  // winding and convexity: every corner must turn left
  for (std::size_t i = 0; i < n; ++i) {
    const Vector& p0 = vertices[i];
    const Vector& p1 = vertices[(i + 1) % n];
    const Vector& p2 = vertices[(i + 2) % n];
    if ((p1 - p0).cross(p2 - p1) <= EPSILON) {
      throw std::invalid_argument("Polygon vertices must be strictly convex and counter-clockwise");
    }
  }

  normals.reserve(n);
  double area = 0.0;
  Vector centroid(0.0, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    const Vector& p1 = vertices[i];
    const Vector& p2 = vertices[(i + 1) % n];
    Vector const e = p2 - p1;
    if (e.isZero()) {
      throw std::invalid_argument("Polygon has coincident vertices");
    }
    normals.push_back(e.rightPerp().normalized());

    double const a = 0.5 * p1.cross(p2);
    area += a;
    centroid += (p1 + p2) * (a / 3.0);
    radius = std::max(radius, p1.length());
  }
  center = centroid / area;
}

Polygon Polygon::rectangle(double width, double height) {
  if (width <= 0.0 || height <= 0.0) {
    throw std::invalid_argument("Rectangle dimensions must be positive");
  }
  double const hw = width * 0.5;
  double const hh = height * 0.5;
  return Polygon({Vector(-hw, -hh), Vector(hw, -hh), Vector(hw, hh), Vector(-hw, hh)});
}

int Polygon::farthestVertexIndex(const Vector& localDirection) const {
  int best = 0;
  double bestProj = -std::numeric_limits<double>::max();
  for (std::size_t i = 0; i < vertices.size(); ++i) {
    double const proj = vertices[i].dotProduct(localDirection);
    if (proj > bestProj) {
      bestProj = proj;
      best = static_cast<int>(i);
    }
  }
  return best;
}

Interval Polygon::project(const Vector& axis, const Transform& transform) const {
  double minProj = std::numeric_limits<double>::max();
  double maxProj = -std::numeric_limits<double>::max();
  for (const auto& v : vertices) {
    double const p = transform.apply(v).dotProduct(axis);
    minProj = std::min(minProj, p);
    maxProj = std::max(maxProj, p);
  }
  return {minProj, maxProj};
}

Vector Polygon::getFarthestPoint(const Vector& direction, const Transform& transform) const {
  Vector const local = transform.inverseRotation(direction);
  return transform.apply(vertices[farthestVertexIndex(local)]);
}

Feature Polygon::getFarthestFeature(const Vector& direction, const Transform& transform) const {
  Vector const local = transform.inverseRotation(direction);
  int const index = farthestVertexIndex(local);
  int const count = static_cast<int>(vertices.size());

  Vertex const maximum{transform.apply(vertices[index]), index};

  // pick the adjacent edge whose normal is closer to the direction
  const Vector& leftN = normals[index == 0 ? count - 1 : index - 1];
  const Vector& rightN = normals[index];

  if (leftN.dotProduct(local) < rightN.dotProduct(local)) {
    int const l = (index == count - 1) ? 0 : index + 1;
    Vertex const left{transform.apply(vertices[l]), l};
    return Feature::makeEdge(maximum, left, maximum, index + 1);
  }
  int const r = (index == 0) ? count - 1 : index - 1;
  Vertex const right{transform.apply(vertices[r]), r};
  return Feature::makeEdge(right, maximum, maximum, index);
}

std::vector<Vector> Polygon::getAxes(const std::vector<Vector>& foci, const Transform& transform) const {
  std::vector<Vector> axes;
  axes.reserve(normals.size() + foci.size());
  for (const auto& n : normals) {
    axes.push_back(transform.applyRotation(n));
  }

  for (const auto& f : foci) {
    Vector closest;
    double minDist = std::numeric_limits<double>::max();
    for (const auto& v : vertices) {
      Vector const w = transform.apply(v);
      double const d = w.distanceSquared(f);
      if (d < minDist) {
        minDist = d;
        closest = w;
      }
    }
    Vector const axis = f - closest;
    axes.push_back(axis.isZero() ? axis : axis.normalized());
  }
  return axes;
}

std::vector<Vector> Polygon::getFoci(const Transform& /*transform*/) const {
  return {};
}

AABB Polygon::createAABB(const Transform& transform) const {
  Vector const first = transform.apply(vertices[0]);
  AABB box(first, first);
  for (std::size_t i = 1; i < vertices.size(); ++i) {
    Vector const w = transform.apply(vertices[i]);
    box.min.x = std::min(box.min.x, w.x);
    box.min.y = std::min(box.min.y, w.y);
    box.max.x = std::max(box.max.x, w.x);
    box.max.y = std::max(box.max.y, w.y);
  }
  return box;
}

bool Polygon::contains(const Vector& point, const Transform& transform) const {
  Vector const p = transform.inverse(point);
  const std::size_t n = vertices.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Vector& a = vertices[i];
    const Vector& b = vertices[(i + 1) % n];
    if ((b - a).cross(p - a) < 0.0) {
      return false;
    }
  }
  return true;
}

} // namespace Geometry
