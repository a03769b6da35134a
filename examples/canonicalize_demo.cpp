#include <animcanon/animcanon.hpp>
#include <cstdlib>
#include <iostream>

using namespace animcanon;

// Canonicalizes a handful of timelines the way the code generator would and
// prints what the canonicalizer shared, shrank and repaired.
//
// Set ANIMCANON_LOG_LEVEL (trace, debug, info, warn, error) to see the
// canonicalizer's own diagnostics.
int main()
{
    LogLevel level = LogLevel::Info;
    if (const char* env = std::getenv("ANIMCANON_LOG_LEVEL"))
        level = Logger::level_from_string(env, level);
    Logger::instance().set_level(level);
    Logger::instance().add_sink(sinks::console_sink());

    Canonicalizer canon;

    // Two opacity timelines parsed from different layers, identical in content.
    auto opacity_a = make_animatable<double>(
        1.0, {{0.0, 1.0}, {15.0, 1.0, Easing::hold()}, {30.0, 0.0}}, 3u);
    auto opacity_b = make_animatable<double>(
        1.0, {{0.0, 1.0}, {15.0, 1.0, Easing::hold()}, {30.0, 0.0}}, 7u);

    auto canon_a = canon.get_optimized_scalar(opacity_a);
    auto canon_b = canon.get_optimized_scalar(opacity_b);
    ANIMCANON_LOG_INFO("demo",
                       "Opacity: {} -> {} keyframes, shared={}",
                       opacity_a->keyframe_count(),
                       canon_a->keyframe_count(),
                       canon_a == canon_b);

    auto fill = make_animatable<Color>(colors::red,
                                       {{0.0, colors::red},
                                        {10.0, colors::red},
                                        {20.0, colors::red},
                                        {40.0, colors::blue}});
    auto fill_canon = canon.get_optimized_color(fill);
    ANIMCANON_LOG_INFO("demo",
                       "Fill: {} -> {} keyframes",
                       fill->keyframe_count(),
                       fill_canon->keyframe_count());

    // A stroke whose second keyframe retraces its line.
    PathGeometry single({BezierSegment::line({0, 0}, {100, 0})});
    PathGeometry retraced({BezierSegment::line({0, 0}, {100, 0}), BezierSegment::line({100, 0}, {0, 0})});
    auto stroke = make_animatable<PathGeometry>(single, {{0.0, single}, {24.0, retraced}});
    auto stroke_canon = canon.get_optimized_path_geometry(stroke);
    ANIMCANON_LOG_INFO("demo",
                       "Stroke: keyframe segment counts now {} and {}",
                       stroke_canon->keyframes()[0].value.segment_count(),
                       stroke_canon->keyframes()[1].value.segment_count());

    // Only frames 12..20 of the fill are needed by a sub-composition.
    std::cout << "Fill keyframes for frames [12, 20]:";
    for (const auto& kf : trim_keyframes(fill_canon->keyframes(), 12.0, 20.0))
        std::cout << ' ' << kf.frame;
    std::cout << '\n';

    const auto& stats = canon.stats();
    std::cout << "requests=" << stats.requests << " hits=" << stats.cache_hits
              << " optimized=" << stats.optimized << " removed=" << stats.keyframes_removed
              << " paths_repaired=" << stats.paths_repaired << '\n';

    try
    {
        canon.get_optimized_scalar(make_animatable<double>(0.0, {}));
    }
    catch (const InvariantViolation& e)
    {
        std::cout << "Rejected malformed timeline: " << e.what() << '\n';
    }

    return EXIT_SUCCESS;
}
