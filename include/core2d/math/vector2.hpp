/**
 * @file vector2.hpp
 * @brief 2D vector primitive used for positions, velocities and normals
 *
 * Mutable (x, y) pair with the handful of operations the collision
 * pipeline needs. Normalizing a zero-length vector is not guarded and
 * produces non-finite components.
 */

#ifndef CORE2D_VECTOR2_HPP
#define CORE2D_VECTOR2_HPP

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector2 {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector2();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector2(double x, double y);

    Vector2 operator-() const;
    Vector2 operator+(const Vector2& b) const;
    Vector2 operator-(const Vector2& b) const;
    Vector2 operator*(double scalar) const;
    Vector2 operator/(double scalar) const;

    Vector2& operator+=(const Vector2& v);
    Vector2& operator-=(const Vector2& v);
    Vector2& operator*=(double scalar);

    bool operator==(const Vector2& v) const;
    bool operator!=(const Vector2& v) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the square root */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dot(const Vector2& v) const;

    /**
     * @brief Scales this vector to unit length in place
     *
     * A zero-length vector divides by zero and ends up with NaN components.
     */
    void normalize();

    /** @brief Returns a unit-length copy, same zero-length caveat as normalize() */
    Vector2 normalized() const;

    /**
     * @brief Euclidean distance between two points
     */
    double dist(const Vector2& p) const;
};

#endif // CORE2D_VECTOR2_HPP
