#pragma once
#include "posescope/PoseTypes.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace posescope {

// ---------- order statistics ----------
double median(std::vector<double> v);                  // copy by value; 0 for empty input
double quantile(std::vector<double> values, double q); // linear interpolation, q clamped to [0,1]

// ---------- masked smoothing ----------
// Centred moving average over the valid samples inside each window (edge-clamped).
// Invalid centres stay NaN: smoothing never fills a gap.
std::vector<double> masked_moving_average(const std::vector<double>& x,
                                          const std::vector<std::uint8_t>& valid,
                                          std::size_t window);

// Centred moving median; windows shrink at the edges (even windows lean on
// earlier samples, as in masked_moving_average).
std::vector<double> moving_median(const std::vector<double>& x, std::size_t window);

// Samples deviating from the moving median by more than madMultiplier * MAD,
// where MAD is the median of those deviations. A zero MAD falls back to
// zeroMadThreshold. Series shorter than the window have no outliers.
std::size_t count_moving_median_outliers(const std::vector<double>& x,
                                         std::size_t window,
                                         double madMultiplier,
                                         double zeroMadThreshold);

// ---------- optional-valued series ----------
MaybeValue mean_of_defined(const std::vector<MaybeValue>& values);
std::vector<double> defined_values(const std::vector<MaybeValue>& values);

// Mean of the defined values in consecutive blocks of `perBin` entries; a block
// with no defined value is missing. The last block may be shorter.
std::vector<MaybeValue> bin_means(const std::vector<MaybeValue>& values, std::size_t perBin);

} // namespace posescope
