#pragma once

#include <cmath>

namespace trigon
{

// 2D point/vector in diagram space (origin at the circle centre, y up).
struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    constexpr Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    constexpr Vec2 operator*(float s) const { return {x * s, y * s}; }

    constexpr bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Vec2& o) const { return !(*this == o); }
};

// Axis-aligned box stored as centre + half extent.
struct Aabb
{
    Vec2 center;
    Vec2 half_extent;

    static constexpr Aabb from_center(Vec2 c, Vec2 half) { return Aabb{c, half}; }

    constexpr float left() const { return center.x - half_extent.x; }
    constexpr float right() const { return center.x + half_extent.x; }
    constexpr float bottom() const { return center.y - half_extent.y; }
    constexpr float top() const { return center.y + half_extent.y; }

    // Closed containment: points on the border are inside.
    constexpr bool contains(Vec2 p) const
    {
        return p.x >= left() && p.x <= right() && p.y >= bottom() && p.y <= top();
    }

    // Strict overlap on both axes; boxes that only touch along an edge do not overlap.
    bool overlaps(const Aabb& o) const
    {
        return std::abs(center.x - o.center.x) < half_extent.x + o.half_extent.x
               && std::abs(center.y - o.center.y) < half_extent.y + o.half_extent.y;
    }
};

}   // namespace trigon
