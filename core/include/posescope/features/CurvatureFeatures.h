#pragma once

#include "../CoreContract.h"
#include "../PoseTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace posescope {
namespace features {

struct CurvatureParams {
    std::string landmark{"Midback"};
    std::size_t derivativeWindow{1};    // half-width h of the central differences, frames
    std::size_t smoothingWindow{1};     // masked moving average applied first; 1 = none
    double minSpeed{0.0};               // arena units / s; slower frames are missing
    double binSeconds{contract::DEFAULT_BIN_SECONDS};
};

struct CurvatureResult {
    FeatureSeries curvature;            // per frame, 1 / arena units
    FeatureSeries binnedCurvature;
    MaybeValue meanCurvature;
};

/**
 * CurvatureAnalyzer: trajectory curvature of one landmark
 *
 *   kappa = |x'y'' - y'x''| / (x'^2 + y'^2)^(3/2)
 *
 * with x' = (x[t+h] - x[t-h]) / (2h dt) and x'' = (x[t+h] - 2x[t] + x[t-h]) / (h dt)^2.
 * Every frame in [t-h, t+h] must be valid; the first and last h frames are
 * missing.
 */
class CurvatureAnalyzer {
public:
    CurvatureAnalyzer() = default;

    CurvatureResult analyze(const NormalizedTrack& track, const CurvatureParams& params) const;

    // Per-frame curvature of an already smoothed path (exposed for tests)
    std::vector<MaybeValue> computeCurvature(const std::vector<double>& x,
                                             const std::vector<double>& y,
                                             const std::vector<std::uint8_t>& valid,
                                             std::size_t halfWidth,
                                             double dt,
                                             double minSpeed) const;
};

}  // namespace features
}  // namespace posescope
