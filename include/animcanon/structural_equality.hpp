#pragma once

#include <animcanon/animatable.hpp>
#include <animcanon/color.hpp>
#include <animcanon/easing.hpp>
#include <animcanon/keyframe.hpp>
#include <animcanon/math.hpp>
#include <animcanon/path_geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <span>

namespace animcanon
{

// How per-keyframe hashes are folded into a sequence hash.
enum class SequenceHashMode : uint8_t
{
    OrderSensitive,   // Positional combine; permutations hash differently
    LegacyXor,        // Symmetric XOR fold, matching older cached output
};

inline size_t hash_combine(size_t seed, size_t value)
{
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

// ─── Leaf hashes ─────────────────────────────────────────────────────────────
// Consistent with operator==: values that compare equal hash equally,
// including +0.0 and -0.0.

size_t hash_value(double v);
size_t hash_value(const Vector2& v);
size_t hash_value(const Vector3& v);
size_t hash_value(const Color& c);
size_t hash_value(const Easing& e);
size_t hash_value(const BezierSegment& s);
size_t hash_value(const PathGeometry& g);

template <typename T>
size_t hash_value(const Keyframe<T>& kf)
{
    size_t h = hash_value(kf.frame);
    h        = hash_combine(h, hash_value(kf.value));
    h        = hash_combine(h, hash_value(kf.spatial_control_point1));
    h        = hash_combine(h, hash_value(kf.spatial_control_point2));
    return hash_combine(h, hash_value(kf.easing));
}

// ─── Sequences ───────────────────────────────────────────────────────────────

template <typename T>
bool keyframes_equal(std::span<const Keyframe<T>> a, std::span<const Keyframe<T>> b)
{
    if (a.data() == b.data() && a.size() == b.size())
        return true;
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (!(a[i] == b[i]))
            return false;
    }
    return true;
}

template <typename T>
size_t hash_keyframes(std::span<const Keyframe<T>> keyframes, SequenceHashMode mode)
{
    size_t h = 0;
    switch (mode)
    {
        case SequenceHashMode::LegacyXor:
            for (const auto& kf : keyframes)
                h ^= hash_value(kf);
            return h;
        case SequenceHashMode::OrderSensitive:
            h = keyframes.size();
            for (const auto& kf : keyframes)
                h = hash_combine(h, hash_value(kf));
            return h;
    }
    return h;
}

// ─── Timelines ───────────────────────────────────────────────────────────────
// property_index is deliberately left out of both.

template <typename T>
bool animatables_equal(const Animatable<T>& a, const Animatable<T>& b)
{
    if (&a == &b)
        return true;
    return a.initial_value() == b.initial_value()
           && keyframes_equal(a.keyframes(), b.keyframes());
}

template <typename T>
size_t hash_animatable(const Animatable<T>& a, SequenceHashMode mode)
{
    return hash_combine(hash_value(a.initial_value()), hash_keyframes(a.keyframes(), mode));
}

// Unordered-map policies over handles. Null handles are never stored.
template <typename T>
struct AnimatableHash
{
    SequenceHashMode mode = SequenceHashMode::OrderSensitive;

    size_t operator()(const AnimatableHandle<T>& a) const { return hash_animatable(*a, mode); }
};

template <typename T>
struct AnimatableEqual
{
    bool operator()(const AnimatableHandle<T>& a, const AnimatableHandle<T>& b) const
    {
        return a == b || animatables_equal(*a, *b);
    }
};

}   // namespace animcanon
