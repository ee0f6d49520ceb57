// curvature_features_test.cpp — finite-difference curvature and its missing-value policy

#include <gtest/gtest.h>

#include "posescope/features/CurvatureFeatures.h"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace posescope;
using namespace posescope::features;
using test_helpers::make_normalized_track;

TEST(CurvatureAnalyzerTest, UniformCircleHasCurvatureOneOverRadius) {
    const double radius = 0.2;
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(720, radius, 360.0)}});
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, CurvatureParams{});

    EXPECT_FALSE(r.curvature.values.front().has_value());
    EXPECT_FALSE(r.curvature.values.back().has_value());
    for (std::size_t t = 1; t + 1 < r.curvature.values.size(); ++t) {
        ASSERT_TRUE(r.curvature.values[t].has_value()) << "frame " << t;
        EXPECT_NEAR(*r.curvature.values[t] * radius, 1.0, 1e-4) << "frame " << t;
    }
    ASSERT_TRUE(r.meanCurvature.has_value());
    EXPECT_NEAR(*r.meanCurvature, 1.0 / radius, 1e-3);
}

TEST(CurvatureAnalyzerTest, WiderStencilStillTracksRadius) {
    const double radius = 0.3;
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(400, radius, 400.0)}});
    CurvatureParams params;
    params.derivativeWindow = 3;
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, params);

    for (std::size_t t = 0; t < 3; ++t) EXPECT_FALSE(r.curvature.values[t].has_value());
    EXPECT_FALSE(r.curvature.values[397].has_value());
    EXPECT_NEAR(*r.curvature.values[200] * radius, 1.0, 1e-3);
}

TEST(CurvatureAnalyzerTest, StraightLineHasZeroCurvature) {
    const auto track = make_normalized_track({{"Midback", test_helpers::line_path(50, 0.1, 0.1, 0.005, 0.003)}});
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, CurvatureParams{});
    ASSERT_TRUE(r.curvature.values[25].has_value());
    EXPECT_NEAR(*r.curvature.values[25], 0.0, 1e-6);
}

TEST(CurvatureAnalyzerTest, StationaryFramesAreMissing) {
    const auto track = make_normalized_track({{"Midback", {std::vector<double>(20, 0.5), std::vector<double>(20, 0.5)}}});
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, CurvatureParams{});
    EXPECT_EQ(r.curvature.definedCount(), 0u);
    EXPECT_FALSE(r.meanCurvature.has_value());
}

TEST(CurvatureAnalyzerTest, InvalidFrameVoidsEveryStencilTouchingIt) {
    auto track = make_normalized_track({{"Midback", test_helpers::circle_path(40, 0.2, 360.0)}});
    test_helpers::invalidate(track, "Midback", 20);
    CurvatureParams params;
    params.derivativeWindow = 2;
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, params);

    for (std::size_t t = 18; t <= 22; ++t) {
        EXPECT_FALSE(r.curvature.values[t].has_value()) << "frame " << t;
    }
    EXPECT_TRUE(r.curvature.values[17].has_value());
    EXPECT_TRUE(r.curvature.values[23].has_value());
}

TEST(CurvatureAnalyzerTest, MinSpeedMasksSlowFrames) {
    // 0.01 units / frame at 30 fps = 0.3 units / s
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(100, 0.2, 125.66)}});
    CurvatureParams params;
    params.minSpeed = 10.0;
    EXPECT_EQ(CurvatureAnalyzer().analyze(track, params).curvature.definedCount(), 0u);
    params.minSpeed = 0.1;
    EXPECT_GT(CurvatureAnalyzer().analyze(track, params).curvature.definedCount(), 0u);
}

TEST(CurvatureAnalyzerTest, SmoothedCircleStaysCloseToOneOverRadius) {
    const double radius = 0.25;
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(720, radius, 360.0)}});
    CurvatureParams params;
    params.smoothingWindow = 3;
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, params);
    EXPECT_NEAR(*r.curvature.values[360] * radius, 1.0, 1e-2);
}

TEST(CurvatureAnalyzerTest, BinnedCurvatureAveragesEachBin) {
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(90, 0.2, 360.0)}});
    CurvatureParams params;
    params.binSeconds = 1.0;
    const CurvatureResult r = CurvatureAnalyzer().analyze(track, params);
    ASSERT_EQ(r.binnedCurvature.values.size(), 3u);
    EXPECT_NEAR(*r.binnedCurvature.values[1], 5.0, 1e-3);
}

TEST(CurvatureAnalyzerTest, ZeroDerivativeWindowIsRejected) {
    const auto track = make_normalized_track({{"Midback", test_helpers::circle_path(10, 0.2, 360.0)}});
    CurvatureParams params;
    params.derivativeWindow = 0;
    EXPECT_THROW(CurvatureAnalyzer().analyze(track, params), std::invalid_argument);
}
