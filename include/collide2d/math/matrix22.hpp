/**
 * @file matrix22.hpp
 * @brief 2x2 matrix for the two-point block contact solver
 */

#ifndef COLLIDE2D_MATRIX22_HPP
#define COLLIDE2D_MATRIX22_HPP

#include "collide2d/math/vector_math.hpp"

/**
 * Row-major:
 * | m00 m01 |
 * | m10 m11 |
 */
struct Matrix22 {
    double m00 = 0.0;
    double m01 = 0.0;
    double m10 = 0.0;
    double m11 = 0.0;

    Matrix22() = default;
    Matrix22(double m00, double m01, double m10, double m11)
        : m00(m00), m01(m01), m10(m10), m11(m11) {}

    double determinant() const { return m00 * m11 - m01 * m10; }

    /** @brief Inverse, or the zero matrix when singular */
    Matrix22 inverse() const {
        double det = determinant();
        if (det != 0.0) {
            det = 1.0 / det;
        }
        return {det * m11, -det * m01, -det * m10, det * m00};
    }

    Vector product(const Vector& v) const {
        return {m00 * v.x + m01 * v.y, m10 * v.x + m11 * v.y};
    }
};

#endif
