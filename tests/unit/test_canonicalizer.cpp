#include <animcanon/canonicalizer.hpp>
#include <animcanon/error.hpp>
#include <animcanon/logger.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace animcanon;

namespace
{
using Kf = Keyframe<double>;

AnimatableHandle<double> redundant_scalar(std::optional<uint32_t> property_index = std::nullopt)
{
    return make_animatable<double>(
        1.0, {Kf(0.0, 1.0), Kf(5.0, 1.0), Kf(10.0, 2.0)}, property_index);
}

AnimatableHandle<double> minimal_scalar()
{
    return make_animatable<double>(0.0, {Kf(0.0, 0.0), Kf(10.0, 5.0)});
}

PathGeometry line(Vector2 a, Vector2 b)
{
    return PathGeometry({BezierSegment::line(a, b)});
}

PathGeometry two_lines(Vector2 a, Vector2 b, Vector2 c)
{
    return PathGeometry({BezierSegment::line(a, b), BezierSegment::line(b, c)});
}
}   // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Canonical results
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Canonicalizer, StaticTimelineReturnedAsIs)
{
    Canonicalizer canon;
    auto value = make_animatable<double>(3.0, {Kf(0.0, 3.0)});
    EXPECT_EQ(canon.get_optimized_scalar(value), value);
    EXPECT_EQ(canon.stats().static_passthrough, 1u);
}

TEST(Canonicalizer, AllKeyframesAtInitialValueIsStatic)
{
    Canonicalizer canon;
    auto value = make_animatable<double>(3.0, {Kf(0.0, 3.0), Kf(5.0, 3.0), Kf(9.0, 3.0)});
    EXPECT_FALSE(value->is_animated());
    EXPECT_EQ(canon.get_optimized_scalar(value), value);
}

TEST(Canonicalizer, AlreadyMinimalReturnedAsIs)
{
    Canonicalizer canon;
    auto value = minimal_scalar();
    EXPECT_EQ(canon.get_optimized_scalar(value), value);
    EXPECT_EQ(canon.stats().unchanged, 1u);
}

TEST(Canonicalizer, RedundantKeyframesRemoved)
{
    Canonicalizer canon;
    auto value  = redundant_scalar(4u);
    auto result = canon.get_optimized_scalar(value);

    ASSERT_NE(result, value);
    EXPECT_DOUBLE_EQ(result->initial_value(), 1.0);
    ASSERT_EQ(result->keyframe_count(), 2u);
    EXPECT_DOUBLE_EQ(result->keyframes()[0].frame, 5.0);
    EXPECT_DOUBLE_EQ(result->keyframes()[1].frame, 10.0);
    EXPECT_FALSE(result->property_index().has_value());

    EXPECT_EQ(canon.stats().optimized, 1u);
    EXPECT_EQ(canon.stats().keyframes_removed, 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Caching
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CanonicalizerCache, StructurallyEqualInputsShareHandle)
{
    Canonicalizer canon;
    auto a = redundant_scalar();
    auto b = redundant_scalar();
    ASSERT_NE(a, b);

    auto ra = canon.get_optimized_scalar(a);
    auto rb = canon.get_optimized_scalar(b);
    EXPECT_EQ(ra, rb);
    EXPECT_EQ(canon.stats().requests, 2u);
    EXPECT_EQ(canon.stats().cache_hits, 1u);
    EXPECT_EQ(canon.cache_size_scalar(), 1u);
}

TEST(CanonicalizerCache, PropertyIndexDoesNotSplitEntries)
{
    Canonicalizer canon;
    auto a = minimal_scalar();
    auto b = make_animatable<double>(0.0, {Kf(0.0, 0.0), Kf(10.0, 5.0)}, 12u);

    // First input wins: the unchanged timeline itself is the canonical value.
    EXPECT_EQ(canon.get_optimized_scalar(a), a);
    EXPECT_EQ(canon.get_optimized_scalar(b), a);
}

TEST(CanonicalizerCache, TypesHaveSeparateTables)
{
    Canonicalizer canon;
    canon.get_optimized_scalar(minimal_scalar());
    canon.get_optimized_color(make_animatable<Color>(
        colors::red, {Keyframe<Color>(0.0, colors::red), Keyframe<Color>(4.0, colors::green)}));

    EXPECT_EQ(canon.cache_size_scalar(), 1u);
    EXPECT_EQ(canon.cache_size_color(), 1u);
    EXPECT_EQ(canon.cache_size_path_geometry(), 0u);
}

TEST(CanonicalizerCache, SeparateInstancesDoNotShare)
{
    Canonicalizer first;
    Canonicalizer second;
    auto a = redundant_scalar();
    EXPECT_NE(first.get_optimized_scalar(a), second.get_optimized_scalar(a));
}

TEST(CanonicalizerCache, LegacyHashModeCachesByStructure)
{
    CanonicalizerConfig config;
    config.hash_mode = SequenceHashMode::LegacyXor;
    Canonicalizer canon(config);

    auto up   = make_animatable<double>(0.0, {Kf(0.0, 0.0), Kf(10.0, 5.0)});
    auto down = make_animatable<double>(5.0, {Kf(0.0, 5.0), Kf(10.0, 0.0)});
    EXPECT_EQ(canon.get_optimized_scalar(up), up);
    EXPECT_EQ(canon.get_optimized_scalar(down), down);
    EXPECT_EQ(canon.get_optimized_scalar(redundant_scalar()),
              canon.get_optimized_scalar(redundant_scalar()));
    EXPECT_EQ(canon.cache_size_scalar(), 3u);
}

TEST(CanonicalizerCache, IdempotentOnCanonicalOutput)
{
    Canonicalizer canon;
    auto once  = canon.get_optimized_scalar(redundant_scalar());
    auto twice = canon.get_optimized_scalar(once);
    EXPECT_TRUE(animatables_equal(*once, *twice));
}

TEST(CanonicalizerCache, ColorTimelineOptimized)
{
    Canonicalizer canon;
    auto value = make_animatable<Color>(colors::white,
                                        {Keyframe<Color>(0.0, colors::white),
                                         Keyframe<Color>(5.0, colors::white, Easing::hold()),
                                         Keyframe<Color>(10.0, colors::black)});
    auto result = canon.get_optimized_color(value);
    ASSERT_EQ(result->keyframe_count(), 2u);
    EXPECT_EQ(result->keyframes()[0].easing, Easing::linear());
    EXPECT_EQ(canon.get_optimized_color(value), result);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Path geometries
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CanonicalizerPath, RetracedLineRepairedAndCached)
{
    Canonicalizer canon;
    auto g1    = line({0, 0}, {10, 0});
    auto g2    = two_lines({0, 0}, {10, 0}, {0, 0});
    auto value = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)});

    auto result = canon.get_optimized_path_geometry(value);
    ASSERT_EQ(result->keyframe_count(), 2u);
    for (const auto& kf : result->keyframes())
    {
        ASSERT_EQ(kf.value.segment_count(), 1u);
        EXPECT_EQ(kf.value.segments[0], BezierSegment::line({0, 0}, {10, 0}));
    }
    EXPECT_EQ(canon.stats().paths_repaired, 1u);

    auto again = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)});
    EXPECT_EQ(canon.get_optimized_path_geometry(again), result);
}

TEST(CanonicalizerPath, RepairedTimelineIsAFixedPoint)
{
    Canonicalizer canon;
    auto short_line = line({0, 0}, {10, 0});
    auto retrace    = two_lines({0, 0}, {10, 0}, {0, 0});
    auto long_line  = line({0, 0}, {20, 0});
    auto value      = make_animatable<PathGeometry>(short_line,
                                                    {Keyframe<PathGeometry>(0.0, short_line),
                                                     Keyframe<PathGeometry>(5.0, retrace),
                                                     Keyframe<PathGeometry>(10.0, long_line)});

    auto once  = canon.get_optimized_path_geometry(value);
    auto twice = canon.get_optimized_path_geometry(once);
    EXPECT_EQ(once->keyframe_count(), 2u);
    EXPECT_TRUE(animatables_equal(*once, *twice));
    EXPECT_EQ(canon.stats().paths_repaired, 1u);
}

TEST(CanonicalizerPath, RepairedTimelineSharedAcrossPropertyIndices)
{
    Canonicalizer canon;
    auto g1 = line({0, 0}, {10, 0});
    auto g2 = two_lines({0, 0}, {10, 0}, {0, 0});
    auto a  = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)}, 1u);
    auto b = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)}, 2u);

    auto from_a = canon.get_optimized_path_geometry(a);
    auto from_b = canon.get_optimized_path_geometry(b);
    EXPECT_EQ(from_a, from_b);
    EXPECT_FALSE(from_b->property_index().has_value());
    EXPECT_EQ(canon.cache_size_path_geometry(), 1u);
}

TEST(CanonicalizerPath, OvershootingSecondSegmentLeftAlone)
{
    Canonicalizer canon;
    auto g1    = line({0, 0}, {10, 0});
    auto g2    = two_lines({0, 0}, {10, 0}, {20, 0});
    auto value = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)});

    auto result = canon.get_optimized_path_geometry(value);
    EXPECT_EQ(result, value);
    EXPECT_EQ(result->keyframes()[1].value.segment_count(), 2u);
    EXPECT_EQ(canon.stats().paths_rejected, 1u);
}

TEST(CanonicalizerPath, ReconciliationCanBeDisabled)
{
    CanonicalizerConfig config;
    config.reconcile_path_segments = false;
    Canonicalizer canon(config);

    auto g1    = line({0, 0}, {10, 0});
    auto g2    = two_lines({0, 0}, {10, 0}, {0, 0});
    auto value = make_animatable<PathGeometry>(
        g1, {Keyframe<PathGeometry>(0.0, g1), Keyframe<PathGeometry>(10.0, g2)});
    EXPECT_EQ(canon.get_optimized_path_geometry(value), value);
    EXPECT_EQ(canon.stats().paths_repaired, 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Contract violations
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CanonicalizerErrors, EmptyTimelineThrowsAndLogs)
{
    auto entries = std::make_shared<std::vector<Logger::LogEntry>>();
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::memory_sink(entries));
    Logger::instance().set_level(LogLevel::Warning);

    Canonicalizer canon;
    auto          empty = make_animatable<double>(1.0, {});
    EXPECT_THROW(canon.get_optimized_scalar(empty), InvariantViolation);
    EXPECT_EQ(canon.cache_size_scalar(), 0u);

    ASSERT_FALSE(entries->empty());
    EXPECT_EQ(entries->back().level, LogLevel::Error);
    EXPECT_EQ(entries->back().category, "canonicalizer");

    Logger::instance().clear_sinks();
}

TEST(CanonicalizerErrors, NullHandleThrows)
{
    Canonicalizer canon;
    EXPECT_THROW(canon.get_optimized_color(nullptr), InvariantViolation);
    EXPECT_THROW(canon.get_optimized_path_geometry(nullptr), InvariantViolation);
}
