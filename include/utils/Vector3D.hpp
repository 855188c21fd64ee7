/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>

namespace Ember {

// A simple 3D vector class
class Vector3D {
public:
    // Constructors
    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    // Normalized copy, falls back to +Y for (near) zero-length vectors
    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 1e-12f) return Vector3D(0.0f, 1.0f, 0.0f);
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    Vector3D cross(const Vector3D& v2) const {
        return Vector3D(m_y * v2.m_z - m_z * v2.m_y,
                        m_z * v2.m_x - m_x * v2.m_z,
                        m_x * v2.m_y - m_y * v2.m_x);
    }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    friend Vector3D& operator+=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        v1.m_z += v2.m_z;
        return v1;
    }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D operator-() const { return Vector3D(-m_x, -m_y, -m_z); }

    friend Vector3D& operator-=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        v1.m_z -= v2.m_z;
        return v1;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    bool operator!=(const Vector3D& v2) const { return !(*this == v2); }

    static float distanceSquared(const Vector3D& a, const Vector3D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        float dz = a.m_z - b.m_z;
        return dx * dx + dy * dy + dz * dz;
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    static Vector3D lerp(const Vector3D& a, const Vector3D& b, float t) {
        return a + (b - a) * t;
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

} // namespace Ember

#endif  // VECTOR_3D_HPP
