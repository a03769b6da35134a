#pragma once

#include <animcanon/math.hpp>
#include <cstdint>

namespace animcanon
{

enum class EasingType : uint8_t
{
    Linear,
    Hold,          // Keep the previous value until the keyframe is reached
    CubicBezier,   // Timing curve through (0,0), cp1, cp2, (1,1)
};

// Easing of the ramp into a keyframe from its predecessor. Control points are
// only meaningful for CubicBezier; the factories leave them zeroed otherwise.
struct Easing
{
    EasingType type = EasingType::Linear;
    Vector2    control_point1;
    Vector2    control_point2;

    static constexpr Easing linear() { return {}; }
    static constexpr Easing hold() { return {EasingType::Hold, {}, {}}; }
    static constexpr Easing cubic_bezier(Vector2 cp1, Vector2 cp2)
    {
        return {EasingType::CubicBezier, cp1, cp2};
    }
};

// Tag and, for CubicBezier, both control points.
bool operator==(const Easing& a, const Easing& b);

// Maps linear segment progress t in [0,1] to eased progress.
// Throws InvariantViolation for an unrecognized tag.
double easing_progress(const Easing& easing, double t);

const char* easing_type_name(EasingType type);

}   // namespace animcanon
