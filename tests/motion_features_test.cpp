// motion_features_test.cpp — speed, distance, binning and stopping points

#include <gtest/gtest.h>

#include "posescope/Errors.h"
#include "posescope/features/MotionFeatures.h"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace posescope;
using namespace posescope::features;
using test_helpers::make_normalized_track;

TEST(MotionAnalyzerTest, StationaryLandmarkHasZeroSpeedAndDistance) {
    const auto track = make_normalized_track({{"Midback", {std::vector<double>(90, 0.4), std::vector<double>(90, 0.6)}}});
    const MotionResult r = MotionAnalyzer().analyze(track, MotionParams{});

    EXPECT_FALSE(r.speed.values[0].has_value());
    for (std::size_t f = 1; f < r.speed.values.size(); ++f) {
        ASSERT_TRUE(r.speed.values[f].has_value()) << "frame " << f;
        EXPECT_DOUBLE_EQ(*r.speed.values[f], 0.0);
    }
    ASSERT_TRUE(r.totalDistance.has_value());
    EXPECT_DOUBLE_EQ(*r.totalDistance, 0.0);
    EXPECT_EQ(r.validSteps, 89u);
}

TEST(MotionAnalyzerTest, ConstantVelocityGivesConstantSpeed) {
    // 0.003 units per frame along x at 30 fps -> 0.09 units / s
    const auto track = make_normalized_track({{"Midback", test_helpers::line_path(301, 0.0, 0.5, 0.003, 0.0)}});
    MotionParams params;
    params.binSeconds = 5.0;
    const MotionResult r = MotionAnalyzer().analyze(track, params);

    EXPECT_NEAR(*r.speed.values[10], 0.09, 1e-12);
    EXPECT_NEAR(*r.totalDistance, 0.9, 1e-9);
    ASSERT_EQ(r.binnedSpeed.values.size(), 3u);   // 150 + 150 + 1 frames
    EXPECT_NEAR(*r.binnedSpeed.values[0], 0.09, 1e-12);
    EXPECT_NEAR(*r.acceleration.values[20], 0.0, 1e-9);
    // duration = 300 / 30 = 10 s
    ASSERT_TRUE(r.velocityPerMinute.has_value());
    EXPECT_NEAR(*r.velocityPerMinute, 0.9 / 10.0 * 60.0, 1e-9);
}

TEST(MotionAnalyzerTest, SpeedNeedsBothFramesValid) {
    auto track = make_normalized_track({{"Midback", test_helpers::line_path(6, 0.0, 0.0, 0.01, 0.0)}});
    test_helpers::invalidate(track, "Midback", 2);
    const MotionResult r = MotionAnalyzer().analyze(track, MotionParams{});

    EXPECT_TRUE(r.speed.values[1].has_value());
    EXPECT_FALSE(r.speed.values[2].has_value());
    EXPECT_FALSE(r.speed.values[3].has_value());   // no bridging across the gap
    EXPECT_TRUE(r.speed.values[4].has_value());
    EXPECT_EQ(r.validSteps, 3u);
    EXPECT_NEAR(*r.totalDistance, 0.03, 1e-12);
}

TEST(MotionAnalyzerTest, BinWithoutValidFramesIsMissingNotZero) {
    auto track = make_normalized_track({{"Midback", test_helpers::line_path(120, 0.0, 0.0, 0.001, 0.0)}});
    for (std::size_t f = 30; f < 60; ++f) test_helpers::invalidate(track, "Midback", f);

    MotionParams params;
    params.binSeconds = 1.0;
    const MotionResult r = MotionAnalyzer().analyze(track, params);
    ASSERT_EQ(r.binnedSpeed.values.size(), 4u);
    EXPECT_TRUE(r.binnedSpeed.values[0].has_value());
    EXPECT_FALSE(r.binnedSpeed.values[1].has_value());
    EXPECT_TRUE(r.binnedSpeed.values[2].has_value());
    EXPECT_DOUBLE_EQ(r.binnedSpeed.sampleRateHz, 1.0);
}

TEST(MotionAnalyzerTest, NoValidStepLeavesDistanceMissing) {
    auto track = make_normalized_track({{"Midback", test_helpers::line_path(4, 0.0, 0.0, 0.01, 0.0)}});
    test_helpers::invalidate(track, "Midback", 1);
    test_helpers::invalidate(track, "Midback", 3);
    const MotionResult r = MotionAnalyzer().analyze(track, MotionParams{});
    EXPECT_EQ(r.validSteps, 0u);
    EXPECT_FALSE(r.totalDistance.has_value());
    EXPECT_FALSE(r.velocityPerMinute.has_value());
}

TEST(MotionAnalyzerTest, ShortTrialHasNoPerMinuteVelocity) {
    const auto track = make_normalized_track({{"Midback", test_helpers::line_path(60, 0.0, 0.0, 0.01, 0.0)}});
    const MotionResult r = MotionAnalyzer().analyze(track, MotionParams{});   // ~2 s < 5 s
    EXPECT_TRUE(r.totalDistance.has_value());
    EXPECT_FALSE(r.velocityPerMinute.has_value());
}

TEST(MotionAnalyzerTest, TimeLimitKeepsTheFrameAtTheLimit) {
    const auto track = make_normalized_track({{"Midback", test_helpers::line_path(300, 0.0, 0.0, 0.001, 0.0)}});
    MotionParams params;
    params.timeLimitSeconds = 2.0;
    const MotionResult r = MotionAnalyzer().analyze(track, params);
    EXPECT_EQ(r.speed.values.size(), 61u);   // frames 0..60, t = 60 / 30 = 2 s included
    EXPECT_NEAR(*r.totalDistance, 0.060, 1e-12);
}

TEST(MotionAnalyzerTest, FramesWithinCountsEveryFrameUpToTheLimit) {
    EXPECT_EQ(frames_within(300, 30.0, 2.0), 61u);
    EXPECT_EQ(frames_within(300, 30.0, 0.7), 22u);      // 0.7 * 30 lands just under 21
    EXPECT_EQ(frames_within(3000, 30.0, 60.0), 1801u);
    EXPECT_EQ(frames_within(300, 30.0, 0.0), 1u);
    EXPECT_EQ(frames_within(100, 30.0, 60.0), 100u);    // clamped to the trial
    EXPECT_EQ(frames_within(100, 30.0, std::nullopt), 100u);
}

TEST(MotionAnalyzerTest, SmoothingAcceptsAnyWindowAndRejectsZero) {
    const auto track = make_normalized_track({{"Midback", test_helpers::line_path(50, 0.0, 0.0, 0.01, 0.0)}});
    for (std::size_t w : {1u, 2u, 5u, 49u, 500u}) {
        MotionParams params;
        params.smoothingWindow = w;
        EXPECT_NO_THROW(MotionAnalyzer().analyze(track, params)) << "window " << w;
    }
    MotionParams bad;
    bad.smoothingWindow = 0;
    EXPECT_THROW(MotionAnalyzer().analyze(track, bad), std::invalid_argument);
}

TEST(MotionAnalyzerTest, MissingLandmarkIsMalformed) {
    const auto track = make_normalized_track({{"Head", {{0.1}, {0.1}}}});
    EXPECT_THROW(MotionAnalyzer().analyze(track, MotionParams{}), MalformedSchema);
}

TEST(MotionAnalyzerTest, DetectStopsFindsStillRuns) {
    // 40 still frames, 20 moving frames, 35 still frames, 10 still frames after a gap
    std::vector<double> x, y;
    for (int i = 0; i < 40; ++i) { x.push_back(0.2); y.push_back(0.2); }
    for (int i = 0; i < 20; ++i) { x.push_back(0.2 + 0.02 * (i + 1)); y.push_back(0.2); }
    for (int i = 0; i < 35; ++i) { x.push_back(0.6 + 0.001 * (i % 3)); y.push_back(0.2); }
    for (int i = 0; i < 11; ++i) { x.push_back(0.6); y.push_back(0.2); }
    auto track = make_normalized_track({{"Midback", {x, y}}});
    test_helpers::invalidate(track, "Midback", 95);

    StopParams params;
    params.minFrames = 30;
    const auto stops = MotionAnalyzer().detectStops(track, params);
    ASSERT_EQ(stops.size(), 2u);
    EXPECT_EQ(stops[0].startFrame, 0u);
    EXPECT_EQ(stops[0].endFrame, 41u);      // first two moving frames still fit in the 0.05 box
    EXPECT_NEAR(stops[0].centerY, 0.2, 1e-12);
    EXPECT_EQ(stops[1].startFrame, 57u);    // last approach frames join the second stop
    EXPECT_EQ(stops[1].endFrame, 94u);      // closed by the invalid frame
}

TEST(MotionAnalyzerTest, JerkIsTheRateOfChangeOfAcceleration) {
    // x = 0.5 a t^2 with a = 0.6 units / s^2 at 30 fps
    std::vector<double> x(40), y(40, 0.5);
    for (std::size_t f = 0; f < x.size(); ++f) {
        const double t = static_cast<double>(f) / 30.0;
        x[f] = 0.3 * t * t;
    }
    const MotionResult r = MotionAnalyzer().analyze(make_normalized_track({{"Midback", {x, y}}}), MotionParams{});
    EXPECT_FALSE(r.acceleration.values[1].has_value());
    EXPECT_FALSE(r.jerk.values[2].has_value());
    ASSERT_TRUE(r.acceleration.values[10].has_value());
    EXPECT_NEAR(*r.acceleration.values[10], 0.6, 1e-6);
    ASSERT_TRUE(r.jerk.values[10].has_value());
    EXPECT_NEAR(*r.jerk.values[10], 0.0, 1e-4);
}

TEST(MotionAnalyzerTest, SingleDisplacedFrameGivesAccelerationAndJerkOutliers) {
    // Step of 1/1024 per frame keeps the steady-state acceleration exactly 0
    auto path = test_helpers::line_path(120, 0.0, 0.0, 1.0 / 1024.0, 0.0);
    path.first[50] += 1.0 / 16.0;
    const MotionAnalyzer analyzer;
    const MotionResult r = analyzer.analyze(make_normalized_track({{"Midback", path}}), MotionParams{});

    const OutlierParams params;
    EXPECT_EQ(analyzer.countOutliers(r.acceleration, params), 3.0);   // frames 50, 51, 52
    EXPECT_EQ(analyzer.countOutliers(r.jerk, params), 4.0);           // frames 50..53
}

TEST(MotionAnalyzerTest, OutlierCountNeedsDefinedValues) {
    const MotionAnalyzer analyzer;
    FeatureSeries empty;
    empty.values.assign(10, std::nullopt);
    EXPECT_FALSE(analyzer.countOutliers(empty, OutlierParams{}).has_value());

    FeatureSeries shortSeries;
    shortSeries.values = {1.0, 50.0, 1.0};   // shorter than the median window
    EXPECT_EQ(analyzer.countOutliers(shortSeries, OutlierParams{}), 0.0);

    OutlierParams bad;
    bad.medianWindow = 0;
    EXPECT_THROW(analyzer.countOutliers(shortSeries, bad), std::invalid_argument);
}
