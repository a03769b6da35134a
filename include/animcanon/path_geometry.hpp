#pragma once

#include <animcanon/math.hpp>
#include <cstdint>
#include <vector>

namespace animcanon
{

enum class SegmentShape : uint8_t
{
    Line,
    Curve,
};

// Cubic Bezier segment. control_point1/2 are absolute positions, not offsets.
struct BezierSegment
{
    Vector2 control_point0;
    Vector2 control_point1;
    Vector2 control_point2;
    Vector2 control_point3;

    constexpr BezierSegment() = default;
    constexpr BezierSegment(Vector2 cp0, Vector2 cp1, Vector2 cp2, Vector2 cp3)
        : control_point0(cp0), control_point1(cp1), control_point2(cp2), control_point3(cp3)
    {
    }

    // Straight segment from `from` to `to` with tangent handles on the endpoints.
    static constexpr BezierSegment line(Vector2 from, Vector2 to) { return {from, from, to, to}; }

    constexpr bool operator==(const BezierSegment&) const = default;

    // True if both handles sit on the chord between the endpoints, so the
    // segment draws a straight line with no curvature or overshoot.
    bool is_line() const;

    SegmentShape shape() const { return is_line() ? SegmentShape::Line : SegmentShape::Curve; }
};

struct PathGeometry
{
    std::vector<BezierSegment> segments;

    PathGeometry() = default;
    explicit PathGeometry(std::vector<BezierSegment> segs) : segments(std::move(segs)) {}

    size_t segment_count() const { return segments.size(); }

    bool operator==(const PathGeometry&) const = default;
};

// True if the signed area of triangle abc, rounded to `decimal_places`
// (ties to even), is zero.
bool are_points_colinear(int decimal_places, Vector2 a, Vector2 b, Vector2 c);

// True if `b` lies between `a` and `c` on each axis independently.
bool is_between(double a, double b, double c);
bool is_between(Vector2 a, Vector2 b, Vector2 c);

const char* segment_shape_name(SegmentShape shape);

}   // namespace animcanon
