#include <animcanon/keyframe_optimizer.hpp>
#include <animcanon/trim.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace animcanon;

namespace
{
using Kf = Keyframe<double>;

std::vector<Kf> at_frames(std::initializer_list<double> frames)
{
    std::vector<Kf> out;
    for (double f : frames)
        out.emplace_back(f, f * 2.0);
    return out;
}

std::vector<double> trimmed_frames(const std::vector<Kf>& keyframes, double start, double end)
{
    std::vector<double> frames;
    for (const auto& kf : trim_keyframes<double>(keyframes, start, end))
        frames.push_back(kf.frame);
    return frames;
}
}   // anonymous namespace

TEST(TrimKeyframes, CandidateBeforeWindowThenThroughEnd)
{
    auto input = at_frames({0, 10, 20, 30});
    EXPECT_EQ(trimmed_frames(input, 12, 25), (std::vector<double>{10, 20, 30}));
}

TEST(TrimKeyframes, OnlyLatestCandidateKept)
{
    auto input = at_frames({0, 5, 10, 15});
    EXPECT_EQ(trimmed_frames(input, 12, 14), (std::vector<double>{10, 15}));
}

TEST(TrimKeyframes, CandidateExactlyAtStart)
{
    auto input = at_frames({0, 10, 20});
    EXPECT_EQ(trimmed_frames(input, 10, 15), (std::vector<double>{10, 20}));
}

TEST(TrimKeyframes, KeyframeExactlyAtEndStopsIteration)
{
    auto input = at_frames({0, 10, 20, 30});
    EXPECT_EQ(trimmed_frames(input, 0, 20), (std::vector<double>{0, 10, 20}));
}

TEST(TrimKeyframes, WindowBeforeAllKeyframes)
{
    auto input = at_frames({5, 10, 20});
    EXPECT_EQ(trimmed_frames(input, 0, 12), (std::vector<double>{5, 10, 20}));
}

TEST(TrimKeyframes, NoKeyframeAfterStartYieldsNothing)
{
    auto input = at_frames({0, 10});
    EXPECT_TRUE(trimmed_frames(input, 20, 30).empty());
}

TEST(TrimKeyframes, FrameZeroAnchorsWindowStartingBeforeIt)
{
    auto input = at_frames({0, 10, 20});
    EXPECT_EQ(trimmed_frames(input, -5, 15), (std::vector<double>{0, 10, 20}));
}

TEST(TrimKeyframes, FrameZeroReplacesEarlierCandidate)
{
    auto input = at_frames({-10, 0, 10, 20});
    EXPECT_EQ(trimmed_frames(input, -5, 5), (std::vector<double>{0, 10}));
}

TEST(TrimKeyframes, PreservesKeyframeContents)
{
    std::vector<Kf> input = {Kf(0.0, 1.0), Kf(10.0, 2.0, Easing::hold()), Kf(20.0, 3.0)};
    std::vector<Kf> out;
    for (const auto& kf : trim_keyframes<double>(input, 5, 10))
        out.push_back(kf);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], input[0]);
    EXPECT_EQ(out[1], input[1]);
}

TEST(TrimKeyframes, MaterializesLikeOtherRanges)
{
    auto input = at_frames({0, 10, 20, 30});
    auto range = trim_keyframes<double>(input, 12, 25);
    auto out   = materialize(range);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(materialize(range), out);
}

TEST(TrimKeyframes, EmptyInput)
{
    std::vector<Kf> input;
    EXPECT_TRUE(trimmed_frames(input, 0, 10).empty());
}
