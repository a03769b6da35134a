#pragma once

#include <animcanon/animatable.hpp>
#include <animcanon/canonicalization_cache.hpp>
#include <animcanon/color.hpp>
#include <animcanon/path_geometry.hpp>
#include <animcanon/structural_equality.hpp>
#include <cstdint>
#include <functional>

namespace animcanon
{

struct CanonicalizerConfig
{
    SequenceHashMode hash_mode               = SequenceHashMode::OrderSensitive;
    bool             reconcile_path_segments = true;   // Repair retraced two-segment lines
};

// Counters across all value types, for diagnostics and tests.
struct CanonicalizerStats
{
    uint64_t requests           = 0;
    uint64_t cache_hits         = 0;
    uint64_t static_passthrough = 0;   // Not animated; returned as-is
    uint64_t unchanged          = 0;   // Animated but already minimal
    uint64_t optimized          = 0;   // A smaller timeline was synthesized
    uint64_t keyframes_removed  = 0;
    uint64_t paths_repaired     = 0;
    uint64_t paths_rejected     = 0;   // Two segment counts, not the fixable pattern
};

// Produces canonical, minimal versions of animation timelines.
//
// Structurally equal inputs of the same value type always yield the same
// output handle for the lifetime of the instance, so later stages can detect
// sharing by pointer identity. Use one instance per generation run; it is not
// safe for concurrent use.
class Canonicalizer
{
   public:
    explicit Canonicalizer(const CanonicalizerConfig& config = {});

    Canonicalizer(const Canonicalizer&)            = delete;
    Canonicalizer& operator=(const Canonicalizer&) = delete;

    // Throw InvariantViolation for a null handle or an empty keyframe list.
    AnimatableHandle<Color>        get_optimized_color(const AnimatableHandle<Color>& value);
    AnimatableHandle<double>       get_optimized_scalar(const AnimatableHandle<double>& value);
    AnimatableHandle<PathGeometry> get_optimized_path_geometry(
        const AnimatableHandle<PathGeometry>& value);

    const CanonicalizerConfig& config() const { return config_; }
    const CanonicalizerStats&  stats() const { return stats_; }

    size_t cache_size_color() const { return colors_.size(); }
    size_t cache_size_scalar() const { return scalars_.size(); }
    size_t cache_size_path_geometry() const { return paths_.size(); }

   private:
    template <typename T>
    using PostProcess =
        std::function<AnimatableHandle<T>(const AnimatableHandle<T>& source,
                                          const AnimatableHandle<T>& optimized)>;

    template <typename T>
    AnimatableHandle<T> canonicalize(const AnimatableHandle<T>& value,
                                     CanonicalizationCache<T>&  cache,
                                     const char*                kind,
                                     const PostProcess<T>&      post_process);

    template <typename T>
    AnimatableHandle<T> optimize_uncached(const AnimatableHandle<T>& value, const char* kind);

    AnimatableHandle<PathGeometry> reconcile(const AnimatableHandle<PathGeometry>& source,
                                             const AnimatableHandle<PathGeometry>& optimized);

    CanonicalizerConfig                 config_;
    CanonicalizerStats                  stats_;
    CanonicalizationCache<Color>        colors_;
    CanonicalizationCache<double>       scalars_;
    CanonicalizationCache<PathGeometry> paths_;
};

}   // namespace animcanon
