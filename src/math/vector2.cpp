#include "core2d/math/vector2.hpp"

#include <cmath>

Vector2::Vector2() : x(0), y(0) {}
Vector2::Vector2(double x, double y) : x(x), y(y) {}

Vector2 Vector2::operator-() const {
    return {-this->x, -this->y};
}

Vector2 Vector2::operator+(const Vector2& b) const {
    return {this->x + b.x, this->y + b.y};
}

Vector2 Vector2::operator-(const Vector2& b) const {
    return {this->x - b.x, this->y - b.y};
}

Vector2 Vector2::operator*(double scalar) const {
    return {this->x * scalar, this->y * scalar};
}

Vector2 Vector2::operator/(double scalar) const {
    return {this->x / scalar, this->y / scalar};
}

Vector2& Vector2::operator+=(const Vector2& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector2& Vector2::operator-=(const Vector2& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

Vector2& Vector2::operator*=(double scalar) {
    this->x *= scalar;
    this->y *= scalar;
    return *this;
}

bool Vector2::operator==(const Vector2& v) const {
    return this->x == v.x && this->y == v.y;
}

bool Vector2::operator!=(const Vector2& v) const {
    return !(*this == v);
}

double Vector2::length() const {
    return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector2::lengthSquared() const {
    return this->x * this->x + this->y * this->y;
}

double Vector2::dot(const Vector2& v) const {
    return this->x * v.x + this->y * v.y;
}

void Vector2::normalize() {
    // No zero check: callers rely on NaN propagating from degenerate input
    double const len = this->length();
    this->x /= len;
    this->y /= len;
}

Vector2 Vector2::normalized() const {
    Vector2 v = *this;
    v.normalize();
    return v;
}

double Vector2::dist(const Vector2& p) const {
    double const dx = this->x - p.x;
    double const dy = this->y - p.y;
    return std::sqrt(dx * dx + dy * dy);
}
