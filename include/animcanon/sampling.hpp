#pragma once

#include <animcanon/animatable.hpp>
#include <animcanon/color.hpp>
#include <animcanon/easing.hpp>
#include <animcanon/math.hpp>
#include <animcanon/path_geometry.hpp>
#include <algorithm>

namespace animcanon
{

// Component-wise linear blend at progress t.
double lerp(double a, double b, double t);
Vector2 lerp(const Vector2& a, const Vector2& b, double t);
Color lerp(const Color& a, const Color& b, double t);
// Geometries with different segment counts cannot be blended; `a` is held
// until t reaches 1.
PathGeometry lerp(const PathGeometry& a, const PathGeometry& b, double t);

// Realized value of a timeline at `frame`: the initial value before the first
// keyframe, the last value after the last keyframe, and in between the eased
// blend governed by the later keyframe's easing.
template <typename T>
T sample(const Animatable<T>& timeline, double frame)
{
    auto keyframes = timeline.keyframes();
    if (keyframes.empty() || frame < keyframes.front().frame)
        return timeline.initial_value();
    if (frame >= keyframes.back().frame)
        return keyframes.back().value;

    auto next = std::upper_bound(keyframes.begin(),
                                 keyframes.end(),
                                 frame,
                                 [](double f, const Keyframe<T>& kf) { return f < kf.frame; });
    auto prev = next - 1;

    double span = next->frame - prev->frame;
    double t    = span > 0.0 ? (frame - prev->frame) / span : 1.0;
    return lerp(prev->value, next->value, easing_progress(next->easing, t));
}

}   // namespace animcanon
