#include <animcanon/logger.hpp>
#include <animcanon/sampling.hpp>

namespace animcanon
{

double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

Vector2 lerp(const Vector2& a, const Vector2& b, double t)
{
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t)};
}

Color lerp(const Color& a, const Color& b, double t)
{
    auto mix = [t](float x, float y)
    { return static_cast<float>(lerp(static_cast<double>(x), static_cast<double>(y), t)); };
    return Color{mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b), mix(a.a, b.a)};
}

PathGeometry lerp(const PathGeometry& a, const PathGeometry& b, double t)
{
    if (a.segment_count() != b.segment_count())
    {
        ANIMCANON_LOG_TRACE("sampler",
                            "Holding geometry: cannot blend {} segments into {}",
                            a.segment_count(),
                            b.segment_count());
        return t >= 1.0 ? b : a;
    }

    std::vector<BezierSegment> segments;
    segments.reserve(a.segment_count());
    for (size_t i = 0; i < a.segment_count(); ++i)
    {
        const auto& sa = a.segments[i];
        const auto& sb = b.segments[i];
        segments.emplace_back(lerp(sa.control_point0, sb.control_point0, t),
                              lerp(sa.control_point1, sb.control_point1, t),
                              lerp(sa.control_point2, sb.control_point2, t),
                              lerp(sa.control_point3, sb.control_point3, t));
    }
    return PathGeometry(std::move(segments));
}

}   // namespace animcanon
