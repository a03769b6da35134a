#pragma once

#include <animcanon/animatable.hpp>
#include <animcanon/path_geometry.hpp>
#include <cstdint>

namespace animcanon
{

enum class ReconcileOutcome : uint8_t
{
    Uniform,     // Every keyframe already has the same segment count
    Irregular,   // More than two distinct segment counts; left alone
    Rejected,    // Two counts, but not the retraced-line pattern
    Repaired,    // Collapsed to one segment per keyframe
};

struct ReconcileResult
{
    AnimatableHandle<PathGeometry> timeline;
    ReconcileOutcome               outcome = ReconcileOutcome::Uniform;
};

// Path keyframes can only be interpolated when their geometries have the same
// number of segments. Detects the one mismatch that is safe to repair: every
// geometry is a single line, or a line followed by a second line that draws
// back over it (ending between the first line's endpoints). In that case every
// keyframe of `optimized` is cut down to its first segment, keyframes made
// redundant by the cut are dropped, and the property index is cleared.
//
// The pattern is checked on the keyframes of `source`; `optimized` is the
// canonical form of `source` and is returned untouched unless Repaired.
// Throws InvariantViolation on an unrecognized segment shape.
[[nodiscard]] ReconcileResult reconcile_segment_counts(
    const Animatable<PathGeometry>&       source,
    const AnimatableHandle<PathGeometry>& optimized);

const char* reconcile_outcome_name(ReconcileOutcome outcome);

}   // namespace animcanon
