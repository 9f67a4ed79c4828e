#include "collide2d/systems/rigid_body_collision/manifold_solver.hpp"
#include "collide2d/core/debug.hpp"

#include <cmath>
#include <utility>

#define ENABLE_MANIFOLD_DEBUG 0
#define MANIFOLD_DEBUG(x) do { if (ENABLE_MANIFOLD_DEBUG) { std::cout << "[Manifold] " << x << std::endl; } } while (0)

namespace RigidBodyCollision {

std::vector<Geometry::Vertex> ClippingManifoldSolver::clip(const Geometry::Vertex& v1,
                                                           const Geometry::Vertex& v2,
                                                           const Vector& n, double offset) {
  std::vector<Geometry::Vertex> points;
  points.reserve(2);

  double const d1 = n.dotProduct(v1.point) - offset;
  double const d2 = n.dotProduct(v2.point) - offset;

  if (d1 <= 0.0) points.push_back(v1);
  if (d2 <= 0.0) points.push_back(v2);

  // endpoints on opposite sides: add the crossing, tagged with the outside vertex
  if (d1 * d2 < 0.0) {
    Vector const e = v2.point - v1.point;
    double const u = d1 / (d1 - d2);
    Geometry::Vertex crossing;
    crossing.point = v1.point + e * u;
    crossing.index = d1 < 0.0 ? v2.index : v1.index;
    points.push_back(crossing);
  }
  return points;
}

bool ClippingManifoldSolver::getManifold(const Penetration& penetration,
                                         const Geometry::Shape& a, const Transform& ta,
                                         const Geometry::Shape& b, const Transform& tb,
                                         Manifold& manifold) const {
  manifold.clear();
  Vector const n = penetration.normal;

  Geometry::Feature const featureA = a.getFarthestFeature(n, ta);
  if (!featureA.isEdge()) {
    manifold.normal = n;
    manifold.points.push_back(ManifoldPoint{DistanceId{}, featureA.max.point, penetration.depth});
    return true;
  }

  Geometry::Feature const featureB = b.getFarthestFeature(-n, tb);
  if (!featureB.isEdge()) {
    manifold.normal = n;
    manifold.points.push_back(ManifoldPoint{DistanceId{}, featureB.max.point, penetration.depth});
    return true;
  }

  // the reference edge is the one most perpendicular to the normal
  Geometry::Feature reference = featureA;
  Geometry::Feature incident = featureB;
  Vector frontDirection = n;
  bool flipped = false;
  if (std::fabs(featureA.edge.dotProduct(n)) > std::fabs(featureB.edge.dotProduct(n))) {
    std::swap(reference, incident);
    frontDirection = -n;
    flipped = true;
  }

  if (reference.edge.isZero()) {
    return false;
  }
  Vector const refev = reference.edge.normalized();

  double const o1 = refev.dotProduct(reference.vertex1.point);
  std::vector<Geometry::Vertex> clipped = clip(incident.vertex1, incident.vertex2, -refev, -o1);
  if (clipped.size() < 2) {
    return false;
  }

  double const o2 = refev.dotProduct(reference.vertex2.point);
  clipped = clip(clipped[0], clipped[1], refev, o2);
  if (clipped.size() < 2) {
    return false;
  }

  Vector frontNormal = refev.perp();
  if (frontNormal.dotProduct(frontDirection) < 0.0) {
    frontNormal = -frontNormal;
  }

  manifold.normal = flipped ? -frontNormal : frontNormal;
  for (const auto& v : clipped) {
    double const depth = frontNormal.dotProduct(reference.max.point - v.point);
    if (depth >= 0.0) {
      IndexedId id;
      id.referenceEdge = reference.index;
      id.incidentEdge = incident.index;
      id.incidentVertex = v.index;
      id.flipped = flipped;
      manifold.points.push_back(ManifoldPoint{id, v.point, depth});
    }
  }

  MANIFOLD_DEBUG("clipped " << manifold.points.size() << " points, flipped=" << flipped);
  return !manifold.points.empty();
}

} // namespace RigidBodyCollision
