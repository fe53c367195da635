#include "carrom/math/vector_math.hpp"

#include <cmath>

double safeSqrt(double d) {
  if (d < 0) {
    return 0.0;
  }
  return std::sqrt(d);
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

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

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

bool Position::operator==(const Position& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Position::operator!=(const Position& other) const {
  return !(*this == other);
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

double Vector::length() const {
  return safeSqrt(this->x * this->x + this->y * this->y);
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = length();
  if (len < EPSILON) {
    return *this;
  }
  return {this->x / len, this->y / len};
}

bool Vector::isZero() const {
  return this->x == 0.0 && this->y == 0.0;
}

Vector Vector::fromAngle(double radians) {
  return {std::cos(radians), std::sin(radians)};
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
