// angle_features_test.cpp — body/motion misalignment, tail bend, heading rate

#include <gtest/gtest.h>

#include "posescope/Errors.h"
#include "posescope/features/AngleFeatures.h"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

using namespace posescope;
using namespace posescope::features;
using test_helpers::make_normalized_track;

namespace {

// Body pointing along +x (tail at origin side), midback moving by (dx, dy) per frame.
NormalizedTrack moving_body(double dx, double dy, std::size_t frames = 5) {
    std::vector<double> hx(frames), hy(frames), tx(frames), ty(frames), mx(frames), my(frames);
    for (std::size_t f = 0; f < frames; ++f) {
        mx[f] = 0.5 + dx * f;
        my[f] = 0.5 + dy * f;
        hx[f] = mx[f] + 0.05;
        hy[f] = my[f];
        tx[f] = mx[f] - 0.05;
        ty[f] = my[f];
    }
    return make_normalized_track({{"Head", {hx, hy}}, {"Midback", {mx, my}}, {"Tailbase", {tx, ty}}});
}

double deg_to_rad(double d) {
    return d * test_helpers::kPi / 180.0;
}

}  // namespace

TEST(AngleAnalyzerTest, MisalignmentFollowsMotionDirection) {
    AngleAnalyzer analyzer;
    const AngleParams params;

    const FeatureSeries forward = analyzer.computeMisalignment(moving_body(0.01, 0.0), params);
    EXPECT_FALSE(forward.values[0].has_value());
    EXPECT_NEAR(*forward.values[2], 0.0, 1e-6);

    const FeatureSeries sideways = analyzer.computeMisalignment(moving_body(0.0, 0.01), params);
    EXPECT_NEAR(*sideways.values[2], 90.0, 1e-9);

    const FeatureSeries backward = analyzer.computeMisalignment(moving_body(-0.01, 0.0), params);
    EXPECT_NEAR(*backward.values[2], 180.0, 1e-6);
}

TEST(AngleAnalyzerTest, NoDisplacementMeansNoDirection) {
    AngleParams params;
    params.minDisplacement = 1e-3;
    const FeatureSeries s = AngleAnalyzer().computeMisalignment(moving_body(1e-4, 0.0), params);
    EXPECT_EQ(s.definedCount(), 0u);
}

TEST(AngleAnalyzerTest, InvalidContributingLandmarkGivesMissing) {
    auto track = moving_body(0.01, 0.0);
    test_helpers::invalidate(track, "Head", 3);
    test_helpers::invalidate(track, "Midback", 1);
    const FeatureSeries s = AngleAnalyzer().computeMisalignment(track, AngleParams{});
    EXPECT_FALSE(s.values[1].has_value());   // midback invalid at f
    EXPECT_FALSE(s.values[2].has_value());   // midback invalid at f-1
    EXPECT_FALSE(s.values[3].has_value());   // head invalid
    EXPECT_TRUE(s.values[4].has_value());
}

TEST(AngleAnalyzerTest, HeadBodyMisalignmentUsesNeckVector) {
    const auto straight = make_normalized_track(
        {{"Head", {{1.0}, {0.0}}}, {"Neck", {{0.9}, {0.0}}}, {"Tailbase", {{0.0}, {0.0}}}});
    EXPECT_NEAR(*AngleAnalyzer().computeHeadBodyMisalignment(straight, AngleParams{}).values[0], 0.0, 1e-6);

    const auto turned = make_normalized_track(
        {{"Head", {{1.0}, {0.0}}}, {"Neck", {{1.0}, {-0.1}}}, {"Tailbase", {{0.0}, {0.0}}}});
    EXPECT_NEAR(*AngleAnalyzer().computeHeadBodyMisalignment(turned, AngleParams{}).values[0], 90.0, 1e-9);
}

TEST(AngleAnalyzerTest, TailBendIsInteriorAngleAtMiddleLandmark) {
    const auto straight = make_normalized_track(
        {{"Midback", {{0.0}, {0.0}}}, {"Lowerback", {{0.1}, {0.0}}}, {"Tailbase", {{0.2}, {0.0}}}});
    EXPECT_NEAR(*AngleAnalyzer().computeTailBend(straight, AngleParams{}).values[0], 180.0, 1e-6);

    const auto bent = make_normalized_track(
        {{"Midback", {{0.0}, {0.0}}}, {"Lowerback", {{0.1}, {0.0}}}, {"Tailbase", {{0.1}, {0.1}}}});
    EXPECT_NEAR(*AngleAnalyzer().computeTailBend(bent, AngleParams{}).values[0], 90.0, 1e-9);
}

TEST(AngleAnalyzerTest, AngularSpeedWrapsAcrossPlusMinus180) {
    // Heading 178, 179, -179 degrees at 30 fps: steps of 1 and 2 degrees
    const std::vector<double> headings{178.0, 179.0, -179.0};
    std::vector<double> hx, hy, tx, ty;
    for (double h : headings) {
        hx.push_back(0.5 + 0.1 * std::cos(deg_to_rad(h)));
        hy.push_back(0.5 + 0.1 * std::sin(deg_to_rad(h)));
        tx.push_back(0.5);
        ty.push_back(0.5);
    }
    const auto track = make_normalized_track({{"Head", {hx, hy}}, {"Tailbase", {tx, ty}}});
    const FeatureSeries s = AngleAnalyzer().computeAngularSpeed(track, AngleParams{});
    EXPECT_FALSE(s.values[0].has_value());
    EXPECT_NEAR(*s.values[1], 30.0, 1e-6);
    EXPECT_NEAR(*s.values[2], 60.0, 1e-6);
}

TEST(AngleAnalyzerTest, AnalyzeRequiresEveryLandmark) {
    EXPECT_THROW(AngleAnalyzer().analyze(moving_body(0.01, 0.0), AngleParams{}), MalformedSchema);

    AngleParams params;
    params.neck = "Head";
    params.bendLandmarks = {"Head", "Midback", "Tailbase"};
    const AngleResult r = AngleAnalyzer().analyze(moving_body(0.01, 0.0), params);
    EXPECT_NEAR(*r.tailBend.values[0], 180.0, 1e-6);
    EXPECT_NEAR(*r.angularSpeed.values[1], 0.0, 1e-9);
}
