/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <algorithm>
#include <cmath>

// A simple 2D vector class (world space, y up)
class Vector2D {
public:
    // Constructors
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    // Both components set to the same value
    static Vector2D splat(float v) { return Vector2D(v, v); }

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    /**
     * @brief Unit vector in the same direction.
     *
     * A zero-length vector has no direction; it is returned unchanged so
     * callers never see NaN components.
     */
    Vector2D normalized() const {
        float len = length();
        if (len <= 0.0f) return *this;
        return Vector2D(m_x / len, m_y / len);
    }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    // Counter-clockwise rotation by radians
    Vector2D rotated(float radians) const {
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return Vector2D(m_x * c - m_y * s, m_x * s + m_y * c);
    }

    // Per-component clamp into [lower, upper]
    Vector2D clamped(const Vector2D& lower, const Vector2D& upper) const {
        return Vector2D(std::clamp(m_x, lower.m_x, upper.m_x),
                        std::clamp(m_y, lower.m_y, upper.m_y));
    }

    // Same direction, length capped at maxLength
    Vector2D limited(float maxLength) const {
        float len = length();
        if (len <= maxLength || len <= 0.0f) return *this;
        return *this * (maxLength / len);
    }

    // Operator overloads
    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    friend Vector2D& operator+=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        return v1;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator-() const { return Vector2D(-m_x, -m_y); }

    friend Vector2D& operator-=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        return v1;
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    Vector2D& operator/=(float scalar) {
        m_x /= scalar;
        m_y /= scalar;
        return *this;
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
