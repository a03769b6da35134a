#include <animcanon/error.hpp>
#include <animcanon/logger.hpp>
#include <animcanon/path_geometry.hpp>
#include <cmath>
#include <string>

namespace animcanon
{

namespace
{
// Control points on the chord are compared at whole-unit precision.
constexpr int LINE_DECIMAL_PLACES = 0;

bool is_on_chord(const Vector2& start, const Vector2& p, const Vector2& end)
{
    return are_points_colinear(LINE_DECIMAL_PLACES, start, p, end) && is_between(start, p, end);
}
}   // anonymous namespace

bool BezierSegment::is_line() const
{
    return is_on_chord(control_point0, control_point1, control_point3)
           && is_on_chord(control_point0, control_point2, control_point3);
}

bool are_points_colinear(int decimal_places, Vector2 a, Vector2 b, Vector2 c)
{
    double area  = a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y);
    double scale = std::pow(10.0, decimal_places);
    // nearbyint uses the current rounding mode, round-half-to-even by default.
    return std::nearbyint(area * scale) == 0.0;
}

bool is_between(double a, double b, double c)
{
    double delta_ac = std::abs(a - c);
    return std::abs(a - b) <= delta_ac && std::abs(c - b) <= delta_ac;
}

bool is_between(Vector2 a, Vector2 b, Vector2 c)
{
    return is_between(a.x, b.x, c.x) && is_between(a.y, b.y, c.y);
}

const char* segment_shape_name(SegmentShape shape)
{
    switch (shape)
    {
        case SegmentShape::Line:
            return "Line";
        case SegmentShape::Curve:
            return "Curve";
    }
    ANIMCANON_LOG_ERROR("path", "Unrecognized segment shape {}", static_cast<int>(shape));
    throw InvariantViolation("segment_shape_name: unrecognized segment shape "
                             + std::to_string(static_cast<int>(shape)));
}

}   // namespace animcanon
