#ifndef COLLIDE2D_COLLISION_RESULTS_HPP
#define COLLIDE2D_COLLISION_RESULTS_HPP

#include "collide2d/math/vector_math.hpp"

/** Overlap of two shapes: unit normal from A toward B and positive depth */
struct Penetration {
    Vector normal;
    double depth = 0.0;
};

/** Gap between two disjoint shapes with the closest point on each */
struct Separation {
    Vector normal;        ///< unit, from A toward B
    double distance = 0.0;
    Vector point1;        ///< closest point on A
    Vector point2;        ///< closest point on B
};

/** First hit of a ray against a shape */
struct RaycastResult {
    Vector point;
    Vector normal;
    double distance = 0.0;
};

#endif
