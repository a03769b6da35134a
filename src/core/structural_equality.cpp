#include <animcanon/error.hpp>
#include <animcanon/logger.hpp>
#include <animcanon/structural_equality.hpp>
#include <functional>
#include <string>

namespace animcanon
{

size_t hash_value(double v)
{
    // +0.0 == -0.0, so both must hash alike.
    return v == 0.0 ? 0 : std::hash<double>{}(v);
}

size_t hash_value(const Vector2& v)
{
    return hash_combine(hash_value(v.x), hash_value(v.y));
}

size_t hash_value(const Vector3& v)
{
    return hash_combine(hash_combine(hash_value(v.x), hash_value(v.y)), hash_value(v.z));
}

size_t hash_value(const Color& c)
{
    size_t h = hash_value(static_cast<double>(c.r));
    h        = hash_combine(h, hash_value(static_cast<double>(c.g)));
    h        = hash_combine(h, hash_value(static_cast<double>(c.b)));
    return hash_combine(h, hash_value(static_cast<double>(c.a)));
}

size_t hash_value(const Easing& e)
{
    size_t h = static_cast<size_t>(e.type);
    switch (e.type)
    {
        case EasingType::Linear:
        case EasingType::Hold:
            return h;
        case EasingType::CubicBezier:
            h = hash_combine(h, hash_value(e.control_point1));
            return hash_combine(h, hash_value(e.control_point2));
    }
    ANIMCANON_LOG_ERROR("equality", "hash_value: unrecognized easing tag {}", static_cast<int>(e.type));
    throw InvariantViolation("hash_value: unrecognized easing tag "
                             + std::to_string(static_cast<int>(e.type)));
}

size_t hash_value(const BezierSegment& s)
{
    size_t h = hash_value(s.control_point0);
    h        = hash_combine(h, hash_value(s.control_point1));
    h        = hash_combine(h, hash_value(s.control_point2));
    return hash_combine(h, hash_value(s.control_point3));
}

size_t hash_value(const PathGeometry& g)
{
    size_t h = g.segments.size();
    for (const auto& s : g.segments)
        h = hash_combine(h, hash_value(s));
    return h;
}

}   // namespace animcanon
