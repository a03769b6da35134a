#include <animcanon/canonicalizer.hpp>
#include <animcanon/error.hpp>
#include <animcanon/keyframe_optimizer.hpp>
#include <animcanon/logger.hpp>
#include <string>

#include "optimize/segment_reconciler.hpp"

namespace animcanon
{

namespace
{
template <typename T>
void require_well_formed(const AnimatableHandle<T>& value, const char* kind)
{
    if (!value)
    {
        ANIMCANON_LOG_ERROR("canonicalizer", "Null {} timeline passed for canonicalization", kind);
        throw InvariantViolation(std::string("canonicalize: null ") + kind + " timeline");
    }
    if (value->keyframe_count() == 0)
    {
        ANIMCANON_LOG_ERROR("canonicalizer", "{} timeline has no keyframes", kind);
        throw InvariantViolation(std::string("canonicalize: ") + kind
                                 + " timeline has no keyframes");
    }
}
}   // anonymous namespace

Canonicalizer::Canonicalizer(const CanonicalizerConfig& config)
    : config_(config), colors_(config.hash_mode), scalars_(config.hash_mode), paths_(config.hash_mode)
{
}

AnimatableHandle<Color> Canonicalizer::get_optimized_color(const AnimatableHandle<Color>& value)
{
    return canonicalize<Color>(value, colors_, "color", nullptr);
}

AnimatableHandle<double> Canonicalizer::get_optimized_scalar(const AnimatableHandle<double>& value)
{
    return canonicalize<double>(value, scalars_, "scalar", nullptr);
}

AnimatableHandle<PathGeometry> Canonicalizer::get_optimized_path_geometry(
    const AnimatableHandle<PathGeometry>& value)
{
    PostProcess<PathGeometry> post;
    if (config_.reconcile_path_segments)
    {
        post = [this](const AnimatableHandle<PathGeometry>& source,
                      const AnimatableHandle<PathGeometry>& optimized)
        { return reconcile(source, optimized); };
    }
    return canonicalize<PathGeometry>(value, paths_, "path", post);
}

template <typename T>
AnimatableHandle<T> Canonicalizer::canonicalize(const AnimatableHandle<T>& value,
                                                CanonicalizationCache<T>&  cache,
                                                const char*                kind,
                                                const PostProcess<T>&      post_process)
{
    require_well_formed(value, kind);
    ++stats_.requests;

    if (auto cached = cache.find(value))
    {
        ++stats_.cache_hits;
        return cached;
    }

    AnimatableHandle<T> result = optimize_uncached(value, kind);
    if (post_process)
        result = post_process(value, result);

    cache.insert(value, result);
    return result;
}

template <typename T>
AnimatableHandle<T> Canonicalizer::optimize_uncached(const AnimatableHandle<T>& value,
                                                     const char*                kind)
{
    if (!value->is_animated())
    {
        ++stats_.static_passthrough;
        return value;
    }

    auto keyframes = materialize(optimize_keyframes(value->initial_value(), value->keyframes()));
    if (keyframes_equal<T>(keyframes, value->keyframes()))
    {
        ++stats_.unchanged;
        return value;
    }

    ++stats_.optimized;
    stats_.keyframes_removed += value->keyframe_count() - keyframes.size();
    ANIMCANON_LOG_DEBUG("canonicalizer",
                        "Optimized {} timeline from {} to {} keyframes",
                        kind,
                        value->keyframe_count(),
                        keyframes.size());

    return make_animatable<T>(value->initial_value(), std::move(keyframes), std::nullopt);
}

AnimatableHandle<PathGeometry> Canonicalizer::reconcile(
    const AnimatableHandle<PathGeometry>& source,
    const AnimatableHandle<PathGeometry>& optimized)
{
    ReconcileResult reconciled = reconcile_segment_counts(*source, optimized);
    switch (reconciled.outcome)
    {
        case ReconcileOutcome::Repaired:
            ++stats_.paths_repaired;
            break;
        case ReconcileOutcome::Rejected:
            ++stats_.paths_rejected;
            ANIMCANON_LOG_INFO("canonicalizer",
                               "Path timeline with {} keyframes keeps mismatched segment counts",
                               source->keyframe_count());
            break;
        case ReconcileOutcome::Uniform:
        case ReconcileOutcome::Irregular:
            break;
    }
    return reconciled.timeline;
}

}   // namespace animcanon
