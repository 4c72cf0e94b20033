// Minimal 2D vector for positions, velocities and directions.
#pragma once

#include <cmath>

namespace Engine {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    Vec2() = default;
    Vec2(float xIn, float yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    float lengthSquared() const { return x * x + y * y; }
    float length() const { return std::sqrt(lengthSquared()); }
};

inline Vec2 operator*(const Vec2& v, float scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2& a, const Vec2& b) { return !(a == b); }

inline float distanceSquared(const Vec2& a, const Vec2& b) { return (a - b).lengthSquared(); }

// True when the two points lie within `reach` of each other. Compares squared magnitudes.
inline bool withinReach(const Vec2& a, const Vec2& b, float reach) {
    return distanceSquared(a, b) <= reach * reach;
}

}  // namespace Engine
