#ifndef COLLIDE2D_RAY_HPP
#define COLLIDE2D_RAY_HPP

#include <stdexcept>
#include "collide2d/math/vector_math.hpp"

namespace Geometry {

/**
 * @brief Half-line with a unit direction
 */
struct Ray {
    Vector start;
    Vector direction;

    /**
     * @throws std::invalid_argument for a zero direction
     */
    Ray(const Vector& start, const Vector& direction) : start(start) {
        if (direction.isZero()) {
            throw std::invalid_argument("Ray direction must be non-zero");
        }
        this->direction = direction.normalized();
    }
};

} // namespace Geometry

#endif
