#include "motion/math/vector_math.hpp"

#include <cmath>
#include <ostream>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
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

Position Position::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
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

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y;
}

bool Position::operator!=(const Position& p) const {
  return !(*this == p);
}

double Position::dist(const Position& p) const {
  return std::hypot(this->x - p.x, this->y - p.y);
}

bool Position::nearlyEquals(const Position& p, double epsilon) const {
  return nearlyEqual(this->x, p.x, epsilon) && nearlyEqual(this->y, p.y, epsilon);
}

std::ostream& operator<<(std::ostream& os, const Position& p) {
  return os << "(" << p.x << ", " << p.y << ")";
}
