// group_stats_test.cpp — group summaries and Welch comparison

#include <gtest/gtest.h>

#include "posescope/GroupStats.h"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace posescope;

TEST(GroupStatsTest, DescribeReportsMeanSdAndSe) {
    const GroupSummary s = GroupwiseStatsEngine().describe("ctrl", {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    EXPECT_EQ(s.label, "ctrl");
    EXPECT_EQ(s.n, 8u);
    EXPECT_DOUBLE_EQ(*s.mean, 5.0);
    EXPECT_NEAR(*s.standardDeviation, std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_NEAR(*s.standardError, std::sqrt(32.0 / 7.0 / 8.0), 1e-12);
}

TEST(GroupStatsTest, WelchMatchesReferenceValues) {
    const GroupStat stat = GroupwiseStatsEngine().compareGroups("a", {1.0, 2.0, 3.0}, "b", {4.0, 5.0, 6.0});
    EXPECT_DOUBLE_EQ(*stat.first.mean, 2.0);
    EXPECT_DOUBLE_EQ(*stat.second.mean, 5.0);

    const GroupComparison& c = stat.comparison;
    ASSERT_TRUE(c.defined());
    EXPECT_NEAR(*c.tStatistic, -3.6742346, 1e-6);
    EXPECT_NEAR(*c.degreesOfFreedom, 4.0, 1e-12);
    EXPECT_NEAR(*c.pValue, 0.0213116, 1e-6);
    EXPECT_NEAR(*c.effectSize, -3.0, 1e-12);
}

TEST(GroupStatsTest, SwappingGroupsFlipsSignKeepsP) {
    GroupwiseStatsEngine engine;
    const std::vector<double> a{0.8, 1.1, 0.9, 1.4, 1.2};
    const std::vector<double> b{1.9, 2.4, 1.5, 2.2};
    const GroupComparison ab = engine.compare(a, b);
    const GroupComparison ba = engine.compare(b, a);
    ASSERT_TRUE(ab.defined());
    EXPECT_NEAR(*ab.tStatistic, -*ba.tStatistic, 1e-12);
    EXPECT_NEAR(*ab.effectSize, -*ba.effectSize, 1e-12);
    EXPECT_NEAR(*ab.pValue, *ba.pValue, 1e-12);
    EXPECT_NEAR(*ab.degreesOfFreedom, *ba.degreesOfFreedom, 1e-12);
}

TEST(GroupStatsTest, UnequalVariancesUseWelchDegreesOfFreedom) {
    const GroupComparison c = GroupwiseStatsEngine().compare({1.0, 2.0, 3.0, 4.0}, {10.0, 30.0});
    // va = 1.6667/4, vb = 200/2
    const double va = (5.0 / 3.0) / 4.0;
    const double vb = 200.0 / 2.0;
    const double df = (va + vb) * (va + vb) / (va * va / 3.0 + vb * vb / 1.0);
    EXPECT_NEAR(*c.degreesOfFreedom, df, 1e-9);
    EXPECT_GT(*c.pValue, 0.0);
    EXPECT_LT(*c.pValue, 1.0);
}

TEST(GroupStatsTest, SingleObservationHasMeanButNoComparison) {
    GroupwiseStatsEngine engine;
    const GroupSummary one = engine.describe("x", {3.5});
    EXPECT_EQ(one.n, 1u);
    EXPECT_DOUBLE_EQ(*one.mean, 3.5);
    EXPECT_FALSE(one.standardError.has_value());
    EXPECT_FALSE(one.standardDeviation.has_value());

    const GroupComparison c = engine.compare({3.5}, {1.0, 2.0, 3.0});
    EXPECT_FALSE(c.defined());
    EXPECT_FALSE(c.effectSize.has_value());
}

TEST(GroupStatsTest, EmptyGroupHasNoMean) {
    const GroupSummary s = GroupwiseStatsEngine().describe("empty", {});
    EXPECT_EQ(s.n, 0u);
    EXPECT_FALSE(s.mean.has_value());
}

TEST(GroupStatsTest, ZeroVarianceInBothGroupsIsUndefined) {
    const GroupComparison c = GroupwiseStatsEngine().compare({2.0, 2.0, 2.0}, {3.0, 3.0});
    EXPECT_FALSE(c.tStatistic.has_value());
    EXPECT_FALSE(c.pValue.has_value());
    EXPECT_FALSE(c.effectSize.has_value());
}

TEST(GroupStatsTest, NonFiniteValuesAreDropped) {
    GroupwiseStatsEngine engine;
    const std::vector<double> noisy{1.0, test_helpers::kNaN, 2.0, INFINITY, 3.0};
    EXPECT_EQ(engine.describe("n", noisy).n, 3u);

    const GroupComparison clean = engine.compare({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0});
    const GroupComparison dirty = engine.compare(noisy, {4.0, 5.0, test_helpers::kNaN, 6.0});
    EXPECT_DOUBLE_EQ(*clean.tStatistic, *dirty.tStatistic);
    EXPECT_DOUBLE_EQ(*clean.pValue, *dirty.pValue);
}

TEST(IncompleteBetaTest, BoundsAndKnownValues) {
    EXPECT_DOUBLE_EQ(regularized_incomplete_beta(2.0, 3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(regularized_incomplete_beta(2.0, 3.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(regularized_incomplete_beta(2.0, 3.0, -0.5), 0.0);
    // I_x(1, 1) = x
    EXPECT_NEAR(regularized_incomplete_beta(1.0, 1.0, 0.3), 0.3, 1e-12);
    // I_x(a, 1) = x^a
    EXPECT_NEAR(regularized_incomplete_beta(3.0, 1.0, 0.7), 0.343, 1e-12);
    // symmetry I_x(a, b) = 1 - I_{1-x}(b, a)
    EXPECT_NEAR(regularized_incomplete_beta(2.5, 4.0, 0.8),
                1.0 - regularized_incomplete_beta(4.0, 2.5, 0.2), 1e-12);
    EXPECT_THROW(regularized_incomplete_beta(0.0, 1.0, 0.5), std::invalid_argument);
}

TEST(IncompleteBetaTest, StudentTTails) {
    EXPECT_NEAR(student_t_two_tailed_p(0.0, 10.0), 1.0, 1e-12);
    // t = 1 with df = 1 (Cauchy): p = 0.5
    EXPECT_NEAR(student_t_two_tailed_p(1.0, 1.0), 0.5, 1e-12);
    // t = 2.228 is the 97.5 % quantile for df = 10
    EXPECT_NEAR(student_t_two_tailed_p(2.228138851986, 10.0), 0.05, 1e-9);
    EXPECT_DOUBLE_EQ(student_t_two_tailed_p(INFINITY, 5.0), 0.0);
    EXPECT_THROW(student_t_two_tailed_p(1.0, 0.0), std::invalid_argument);
}
