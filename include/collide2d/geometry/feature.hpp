/**
 * @file feature.hpp
 * @brief Farthest-feature description (vertex or edge) used by manifold clipping
 */

#ifndef COLLIDE2D_FEATURE_HPP
#define COLLIDE2D_FEATURE_HPP

#include "collide2d/math/vector_math.hpp"

namespace Geometry {

/**
 * @brief A world-space vertex tagged with its index in the owning shape
 */
struct Vertex {
    Vector point;
    int index = 0;
};

/**
 * @brief Either a single vertex or an edge of a shape
 *
 * For an edge, vertex1 -> vertex2 is the edge, `edge` is vertex2 - vertex1 and
 * `max` is the endpoint farthest along the query direction. For a point only
 * `max` is meaningful.
 */
struct Feature {
    enum class Type { Point, Edge };

    Type type = Type::Point;
    Vertex vertex1;
    Vertex vertex2;
    Vertex max;
    Vector edge;
    int index = 0;

    bool isEdge() const { return type == Type::Edge; }

    static Feature point(const Vector& p, int index) {
        Feature f;
        f.type = Type::Point;
        f.max = Vertex{p, index};
        f.vertex1 = f.max;
        f.vertex2 = f.max;
        f.index = index;
        return f;
    }

    static Feature makeEdge(const Vertex& v1, const Vertex& v2, const Vertex& max, int index) {
        Feature f;
        f.type = Type::Edge;
        f.vertex1 = v1;
        f.vertex2 = v2;
        f.max = max;
        f.edge = v2.point - v1.point;
        f.index = index;
        return f;
    }
};

} // namespace Geometry

#endif
