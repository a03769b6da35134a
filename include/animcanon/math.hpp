#pragma once

namespace animcanon
{

struct Vector2
{
    double x = 0.0;
    double y = 0.0;

    constexpr Vector2() = default;
    constexpr Vector2(double x, double y) : x(x), y(y) {}

    constexpr bool operator==(const Vector2&) const = default;

    constexpr Vector2 operator+(const Vector2& o) const { return {x + o.x, y + o.y}; }
    constexpr Vector2 operator-(const Vector2& o) const { return {x - o.x, y - o.y}; }
    constexpr Vector2 operator*(double s) const { return {x * s, y * s}; }
};

struct Vector3
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vector3() = default;
    constexpr Vector3(double x, double y, double z) : x(x), y(y), z(z) {}

    constexpr bool operator==(const Vector3&) const = default;

    static constexpr Vector3 zero() { return {}; }
};

}   // namespace animcanon
