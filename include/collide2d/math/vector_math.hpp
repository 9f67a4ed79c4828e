/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics library
 *
 * This file provides the geometric primitives every collision stage builds on:
 * - Vector class for directions, offsets and velocities
 * - Position class for body locations stored in the registry
 * - Dot, cross and triple products used by SAT, GJK and the solver
 */

#ifndef COLLIDE2D_VECTOR_MATH_HPP
#define COLLIDE2D_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Shared tolerance for floating point comparisons
 *
 * Every stage (projection, simplex evolution, clipping, solver) uses this one
 * value so that their near-zero decisions agree.
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Square root that warns instead of producing NaN silently
 *
 * @param d Input value
 * @return double Square root of input, 0 for negative input
 */
double safeSqrt(double d);

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 2D point in space
 *
 * Used for absolute body locations. Converts freely to and from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    Position();
    Position(double x, double y);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude (no square root) */
    double lengthSquared() const;

    /** @brief True when both components are within EPSILON of zero */
    bool isZero() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector& other) const;

    /**
     * @brief Cross product of this vector with a scalar z-axis value
     *
     * Equivalent to (x, y, 0) x (0, 0, z).
     */
    Vector cross(double z) const;

    /** @brief Returns perpendicular vector (rotated 90 degrees counter-clockwise) */
    Vector perp() const;

    /** @brief Returns perpendicular vector (rotated 90 degrees clockwise) */
    Vector rightPerp() const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * Zero-length vectors return (1, 0); callers that can receive a degenerate
     * direction test isZero() first.
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians
     * @return Rotated vector
     */
    Vector rotateByAngle(double angle) const;

    /** @brief Squared distance between the points this and p */
    double distanceSquared(const Vector& p) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);
};

/** @brief Scalar cross vector, (0, 0, s) x (v.x, v.y, 0) */
Vector cross(double s, const Vector& v);

/**
 * @brief Computes (a x b) x c expanded to 2D
 *
 * Gives the component of c perpendicular to a, oriented toward the side
 * selected by b. GJK uses it to build search directions.
 */
Vector tripleProduct(const Vector& a, const Vector& b, const Vector& c);

/**
 * @brief Finds closest point on line segment to a point
 *
 * @param a Start point of line segment
 * @param b End point of line segment
 * @param p Point to find closest position to
 * @return Vector Position of closest point on line segment ab
 */
Vector closestPointOnLine(const Vector& a, const Vector& b, const Vector& p);

#endif
