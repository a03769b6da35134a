#include "optimize/segment_reconciler.hpp"

#include <animcanon/error.hpp>
#include <animcanon/keyframe_optimizer.hpp>
#include <animcanon/logger.hpp>
#include <animcanon/structural_equality.hpp>
#include <set>
#include <string>
#include <vector>

namespace animcanon
{

namespace
{

constexpr int COLINEAR_DECIMAL_PLACES = 0;

bool all_lines(const PathGeometry& geometry)
{
    for (const auto& segment : geometry.segments)
    {
        switch (segment.shape())
        {
            case SegmentShape::Line:
                break;
            case SegmentShape::Curve:
                return false;
            default:
                ANIMCANON_LOG_ERROR("reconciler",
                                    "Unrecognized segment shape {}",
                                    static_cast<int>(segment.shape()));
                throw InvariantViolation("reconcile_segment_counts: unrecognized segment shape");
        }
    }
    return true;
}

// Second segment retraces the first: a, b, c colinear and c between a and b.
bool is_retraced_line(const PathGeometry& geometry)
{
    const Vector2& a = geometry.segments[0].control_point0;
    const Vector2& b = geometry.segments[0].control_point3;
    const Vector2& c = geometry.segments[1].control_point3;

    return are_points_colinear(COLINEAR_DECIMAL_PLACES, a, b, c) && is_between(a, c, b);
}

bool is_collapsible(const PathGeometry& geometry)
{
    if (!all_lines(geometry))
        return false;

    switch (geometry.segment_count())
    {
        case 1:
            return true;
        case 2:
            return is_retraced_line(geometry);
        default:
            return false;
    }
}

Keyframe<PathGeometry> keep_first_segment(const Keyframe<PathGeometry>& kf)
{
    return Keyframe<PathGeometry>(kf.frame,
                                  PathGeometry(std::vector<BezierSegment>{kf.value.segments.front()}),
                                  Vector3::zero(),
                                  Vector3::zero(),
                                  kf.easing);
}

}   // anonymous namespace

ReconcileResult reconcile_segment_counts(const Animatable<PathGeometry>&       source,
                                         const AnimatableHandle<PathGeometry>& optimized)
{
    std::set<size_t> counts;
    for (const auto& kf : source.keyframes())
        counts.insert(kf.value.segment_count());

    if (counts.size() < 2)
        return {optimized, ReconcileOutcome::Uniform};
    if (counts.size() > 2)
        return {optimized, ReconcileOutcome::Irregular};

    for (const auto& kf : source.keyframes())
    {
        if (!is_collapsible(kf.value))
        {
            ANIMCANON_LOG_DEBUG("reconciler",
                                "Segment counts differ but frame {} is not a retraced line",
                                kf.frame);
            return {optimized, ReconcileOutcome::Rejected};
        }
    }

    if (optimized->keyframe_count() == 0)
    {
        ANIMCANON_LOG_ERROR("reconciler", "Optimized path timeline has no keyframes");
        throw InvariantViolation("reconcile_segment_counts: optimized timeline has no keyframes");
    }

    std::vector<Keyframe<PathGeometry>> keyframes;
    keyframes.reserve(optimized->keyframe_count());
    for (const auto& kf : optimized->keyframes())
        keyframes.push_back(keep_first_segment(kf));

    PathGeometry initial = keyframes.front().value;

    // Collapsing can make neighbouring keyframes equal; drop the ones that no
    // longer change the value. An empty reduction means the result is static.
    auto reduced = materialize(optimize_keyframes<PathGeometry>(initial, keyframes));
    if (!reduced.empty() && !keyframes_equal<PathGeometry>(reduced, keyframes))
        keyframes = std::move(reduced);

    ANIMCANON_LOG_DEBUG("reconciler", "Collapsed path timeline to {} one-segment keyframes",
                        keyframes.size());
    return {make_animatable(std::move(initial), std::move(keyframes), std::nullopt),
            ReconcileOutcome::Repaired};
}

const char* reconcile_outcome_name(ReconcileOutcome outcome)
{
    switch (outcome)
    {
        case ReconcileOutcome::Uniform:
            return "Uniform";
        case ReconcileOutcome::Irregular:
            return "Irregular";
        case ReconcileOutcome::Rejected:
            return "Rejected";
        case ReconcileOutcome::Repaired:
            return "Repaired";
    }
    return "Unknown";
}

}   // namespace animcanon
