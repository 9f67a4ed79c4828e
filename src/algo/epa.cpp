#include "collide2d/algo/epa.hpp"
#include "collide2d/algo/minkowski.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

// Outward normal of polytope edge ab (away from the origin) and its distance
double edgeDistance(const Vector& a, const Vector& b, Vector& normal) {
    Vector const e = b - a;
    normal = e.rightPerp().normalized();
    double dist = normal.dotProduct(a);
    if (dist < 0) {
        normal = -normal;
        dist = -dist;
    }
    return dist;
}

} // namespace

std::optional<Penetration> EPA(const Geometry::Shape* a, const Transform& ta,
                               const Geometry::Shape* b, const Transform& tb,
                               const Simplex& simplex, int maxIterations)
{
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("EPA: shape must not be null");
    }
    if (simplex.points.size() != 3) {
        std::cerr << "Warning: EPA needs a triangle simplex, got "
                  << simplex.points.size() << " points. Returning no penetration." << std::endl;
        return std::nullopt;
    }

    std::vector<Vector> poly = simplex.points;

    double const area = (poly[1] - poly[0]).cross(poly[2] - poly[0]);
    if (std::fabs(area) < 1e-14) {
        std::cerr << "Warning: EPA degenerate simplex (collinear points). Returning no penetration." << std::endl;
        return std::nullopt;
    }
    if (area < 0) {
        std::reverse(poly.begin(), poly.end());
    }

    MinkowskiSum const ms(*a, ta, *b, tb);

    // closest edge of the last expansion, the answer when iterations run out
    bool expanded = false;
    Penetration last;

    for (int iter = 0; iter < maxIterations; iter++) {
        double closestDist = std::numeric_limits<double>::max();
        std::size_t closestEdge = 0;
        Vector edgeNormal;

        for (std::size_t i = 0; i < poly.size(); i++) {
            std::size_t const j = (i + 1) % poly.size();
            if ((poly[j] - poly[i]).isZero()) {
                continue;
            }
            Vector normal;
            double const dist = edgeDistance(poly[i], poly[j], normal);
            if (dist < closestDist) {
                closestDist = dist;
                closestEdge = i;
                edgeNormal = normal;
            }
        }

        if (closestDist == std::numeric_limits<double>::max()) {
            std::cerr << "Warning: EPA no closest edge found. Returning no penetration." << std::endl;
            return std::nullopt;
        }

        Vector const p = ms.support(edgeNormal);
        double const d = p.dotProduct(edgeNormal);

        // the boundary does not extend past this edge
        if (d - closestDist < std::sqrt(EPSILON)) {
            Penetration result;
            result.normal = edgeNormal;
            result.depth = d;
            return result;
        }

        expanded = true;
        last.normal = edgeNormal;
        last.depth = d;
        poly.insert(poly.begin() + static_cast<std::ptrdiff_t>(closestEdge + 1), p);
    }

    if (!expanded) {
        std::cerr << "Warning: EPA ran no iterations. Returning no penetration." << std::endl;
        return std::nullopt;
    }
    return last;
}
