#include "collide2d/math/vector_math.hpp"

#include <iostream>
#include <cmath>

double safeSqrt(double d) {
  if (d < 0) {
    std::cerr << "Warning: sqrt of negative value " << d << std::endl;
    return 0.0;
  }
  return std::sqrt(d);
}

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return safeSqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Position& p) {
  this->x += p.x;
  this->y += p.y;
  return *this;
}

Position& Position::operator-=(const Position& p) {
  this->x -= p.x;
  this->y -= p.y;
  return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y;
}

bool Vector::operator!=(const Vector& v) const {
  return !(*this == v);
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

bool Vector::isZero() const {
  return std::fabs(this->x) <= EPSILON && std::fabs(this->y) <= EPSILON;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector& other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::cross(double z) const {
  return {this->y * z, -this->x * z};
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::rightPerp() const {
  return {this->y, -this->x};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x * c - this->y * s, this->x * s + this->y * c};
}

double Vector::distanceSquared(const Vector& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return dx * dx + dy * dy;
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

Vector& Vector::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

Vector cross(double s, const Vector& v) {
  return {-s * v.y, s * v.x};
}

Vector tripleProduct(const Vector& a, const Vector& b, const Vector& c) {
  // (a x b) x c = b(a.c) - a(b.c)
  double const ac = a.dotProduct(c);
  double const bc = b.dotProduct(c);
  return {b.x * ac - a.x * bc, b.y * ac - a.y * bc};
}

Vector closestPointOnLine(const Vector& a, const Vector& b, const Vector& p) {
  Vector const ab = b - a;
  double const denom = ab.lengthSquared();
  if (denom <= EPSILON) {
    return a;
  }
  double t = (p - a).dotProduct(ab) / denom;
  if (t < 0.0) t = 0.0;
  if (t > 1.0) t = 1.0;
  return a + ab * t;
}
