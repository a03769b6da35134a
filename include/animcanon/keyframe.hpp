#pragma once

#include <animcanon/easing.hpp>
#include <animcanon/math.hpp>
#include <utility>

namespace animcanon
{

// Value `value` reached at time `frame`. The easing governs the ramp from the
// previous keyframe into this one; the spatial control points are the tangent
// handles used when the value is a position on a 2D motion path.
template <typename T>
struct Keyframe
{
    double  frame = 0.0;
    T       value{};
    Vector3 spatial_control_point1;
    Vector3 spatial_control_point2;
    Easing  easing;

    Keyframe() = default;
    Keyframe(double frame, T value, Easing easing = Easing::linear())
        : frame(frame), value(std::move(value)), easing(easing)
    {
    }
    Keyframe(double  frame,
             T       value,
             Vector3 spatial_control_point1,
             Vector3 spatial_control_point2,
             Easing  easing)
        : frame(frame),
          value(std::move(value)),
          spatial_control_point1(spatial_control_point1),
          spatial_control_point2(spatial_control_point2),
          easing(easing)
    {
    }

    // Same keyframe with a different easing.
    Keyframe with_easing(Easing e) const
    {
        return Keyframe(frame, value, spatial_control_point1, spatial_control_point2, e);
    }
};

template <typename T>
bool operator==(const Keyframe<T>& a, const Keyframe<T>& b)
{
    return a.frame == b.frame && a.value == b.value
           && a.spatial_control_point1 == b.spatial_control_point1
           && a.spatial_control_point2 == b.spatial_control_point2 && a.easing == b.easing;
}

}   // namespace animcanon
