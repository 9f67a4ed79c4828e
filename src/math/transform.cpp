#include "collide2d/math/transform.hpp"

#include <cmath>

Transform::Transform() : translation(0.0, 0.0), angle(0.0), c(1.0), s(0.0) {}

Transform::Transform(const Vector& translation, double angle)
    : translation(translation), angle(angle), c(std::cos(angle)), s(std::sin(angle)) {}

void Transform::setAngle(double a) {
  angle = a;
  c = std::cos(a);
  s = std::sin(a);
}

void Transform::rotate(double theta, const Vector& center) {
  Vector const offset = (translation - center).rotateByAngle(theta);
  translation = center + offset;
  setAngle(angle + theta);
}

Vector Transform::apply(const Vector& local) const {
  return {c * local.x - s * local.y + translation.x,
          s * local.x + c * local.y + translation.y};
}

Vector Transform::applyRotation(const Vector& local) const {
  return {c * local.x - s * local.y, s * local.x + c * local.y};
}

Vector Transform::inverse(const Vector& world) const {
  double const dx = world.x - translation.x;
  double const dy = world.y - translation.y;
  return {c * dx + s * dy, -s * dx + c * dy};
}

Vector Transform::inverseRotation(const Vector& world) const {
  return {c * world.x + s * world.y, -s * world.x + c * world.y};
}

Transform Transform::lerp(const Vector& dp, double da, double t) const {
  return {translation + dp * t, angle + da * t};
}
