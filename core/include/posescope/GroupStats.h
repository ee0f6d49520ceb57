#pragma once

#include "posescope/PoseTypes.h"

#include <string>
#include <vector>

namespace posescope {

/**
 * GroupwiseStatsEngine: per-group summaries and Welch comparison
 *
 * Non-finite inputs are dropped first. A group with n < 2 leaves the
 * comparison undefined; zero variance in both groups leaves t, p and d
 * undefined. Nothing here throws for degenerate groups.
 */
class GroupwiseStatsEngine {
  public:
    GroupSummary describe(const std::string& label, const std::vector<double>& values) const;

    // t and d follow (first - second); p is two-tailed.
    GroupComparison compare(const std::vector<double>& first, const std::vector<double>& second) const;

    GroupStat compareGroups(const std::string& firstLabel,
                            const std::vector<double>& first,
                            const std::string& secondLabel,
                            const std::vector<double>& second) const;
};

// I_x(a, b) by continued fraction; x outside [0,1] is clamped.
double regularized_incomplete_beta(double a, double b, double x);

// Two-tailed p-value of Student's t with df degrees of freedom.
double student_t_two_tailed_p(double t, double df);

}  // namespace posescope
