/**
 * @file transform.hpp
 * @brief Rigid 2D transform (translation + rotation)
 */

#ifndef COLLIDE2D_TRANSFORM_HPP
#define COLLIDE2D_TRANSFORM_HPP

#include "collide2d/math/vector_math.hpp"

/**
 * @brief Maps shape-local coordinates into world space
 *
 * A world point is rotate(local) + translation. The sine and cosine are cached
 * because shapes transform many vertices per query.
 */
class Transform {
public:
    Transform();
    Transform(const Vector& translation, double angle);

    const Vector& getTranslation() const { return translation; }
    double getAngle() const { return angle; }
    double getCos() const { return c; }
    double getSin() const { return s; }

    void setTranslation(const Vector& t) { translation = t; }
    void setAngle(double a);
    void translate(const Vector& d) { translation += d; }

    /**
     * @brief Rotates the transform about a world point
     * @param theta Angle increment in radians
     * @param center World-space pivot
     */
    void rotate(double theta, const Vector& center);

    /** @brief local -> world (rotation and translation) */
    Vector apply(const Vector& local) const;

    /** @brief local -> world direction (rotation only) */
    Vector applyRotation(const Vector& local) const;

    /** @brief world -> local (rotation and translation) */
    Vector inverse(const Vector& world) const;

    /** @brief world -> local direction (rotation only) */
    Vector inverseRotation(const Vector& world) const;

    /**
     * @brief Interpolates along a swept motion
     *
     * Returns this transform advanced by the fraction t of the linear
     * displacement dp and angular displacement da over the step. The rotation
     * is applied about the translation (the body center).
     */
    Transform lerp(const Vector& dp, double da, double t) const;

private:
    Vector translation;
    double angle;
    double c;
    double s;
};

#endif
