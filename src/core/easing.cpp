#include <algorithm>
#include <animcanon/easing.hpp>
#include <animcanon/error.hpp>
#include <animcanon/logger.hpp>
#include <cmath>
#include <string>

namespace animcanon
{

namespace
{

[[noreturn]] void fail_unknown_tag(EasingType type, const char* where)
{
    ANIMCANON_LOG_ERROR("easing", "{}: unrecognized easing tag {}", where, static_cast<int>(type));
    throw InvariantViolation(std::string(where) + ": unrecognized easing tag "
                             + std::to_string(static_cast<int>(type)));
}

// Timing curve through (0,0), p1, p2, (1,1). Finds the curve parameter u with
// bezier_x(u) == t by Newton-Raphson, then returns bezier_y(u).
double solve_cubic_bezier(const Vector2& p1, const Vector2& p2, double t)
{
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;

    double u = t;
    for (int i = 0; i < 8; ++i)
    {
        double u2   = u * u;
        double u3   = u2 * u;
        double inv  = 1.0 - u;
        double inv2 = inv * inv;

        double bx = 3.0 * inv2 * u * p1.x + 3.0 * inv * u2 * p2.x + u3;
        double dx = 3.0 * inv2 * p1.x + 6.0 * inv * u * (p2.x - p1.x) + 3.0 * u2 * (1.0 - p2.x);

        if (std::abs(dx) < 1e-9)
            break;
        u -= (bx - t) / dx;
        u = std::clamp(u, 0.0, 1.0);
    }

    double inv  = 1.0 - u;
    double inv2 = inv * inv;
    double u2   = u * u;
    return 3.0 * inv2 * u * p1.y + 3.0 * inv * u2 * p2.y + u2 * u;
}

}   // anonymous namespace

bool operator==(const Easing& a, const Easing& b)
{
    if (a.type != b.type)
        return false;
    if (a.type != EasingType::CubicBezier)
        return true;
    return a.control_point1 == b.control_point1 && a.control_point2 == b.control_point2;
}

double easing_progress(const Easing& easing, double t)
{
    switch (easing.type)
    {
        case EasingType::Linear:
            return std::clamp(t, 0.0, 1.0);
        case EasingType::Hold:
            return t >= 1.0 ? 1.0 : 0.0;
        case EasingType::CubicBezier:
            return solve_cubic_bezier(easing.control_point1, easing.control_point2, t);
    }
    fail_unknown_tag(easing.type, "easing_progress");
}

const char* easing_type_name(EasingType type)
{
    switch (type)
    {
        case EasingType::Linear:
            return "Linear";
        case EasingType::Hold:
            return "Hold";
        case EasingType::CubicBezier:
            return "CubicBezier";
    }
    fail_unknown_tag(type, "easing_type_name");
}

}   // namespace animcanon
