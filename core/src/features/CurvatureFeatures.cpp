#include "posescope/features/CurvatureFeatures.h"
#include "posescope/SeriesMath.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace posescope {
namespace features {

std::vector<MaybeValue> CurvatureAnalyzer::computeCurvature(const std::vector<double>& x,
                                                            const std::vector<double>& y,
                                                            const std::vector<std::uint8_t>& valid,
                                                            std::size_t halfWidth,
                                                            double dt,
                                                            double minSpeed) const {
    if (halfWidth == 0) throw std::invalid_argument("derivative window must be >= 1");
    if (!(dt > 0.0)) throw std::invalid_argument("frame interval must be > 0");
    if (x.size() != y.size() || x.size() != valid.size()) {
        throw std::invalid_argument("x/y/valid size mismatch");
    }

    const std::size_t n = x.size();
    const std::size_t h = halfWidth;
    const double speedFloor = std::max(contract::STATIONARY_SPEED_EPS, minSpeed);
    const double span1 = 2.0 * static_cast<double>(h) * dt;
    const double span2 = (static_cast<double>(h) * dt) * (static_cast<double>(h) * dt);

    std::vector<MaybeValue> kappa(n);
    if (n < 2 * h + 1) return kappa;

    // Count of invalid frames in the current stencil [t-h, t+h]
    std::size_t invalid = 0;
    for (std::size_t j = 0; j < 2 * h + 1; ++j) invalid += valid[j] ? 0 : 1;

    for (std::size_t t = h; t + h < n; ++t) {
        if (t > h) {
            invalid -= valid[t - h - 1] ? 0 : 1;
            invalid += valid[t + h] ? 0 : 1;
        }
        if (invalid > 0) continue;

        const double dx = (x[t + h] - x[t - h]) / span1;
        const double dy = (y[t + h] - y[t - h]) / span1;
        const double ddx = (x[t + h] - 2.0 * x[t] + x[t - h]) / span2;
        const double ddy = (y[t + h] - 2.0 * y[t] + y[t - h]) / span2;

        const double speed = std::hypot(dx, dy);
        if (!(speed >= speedFloor) || speed == 0.0) continue;
        kappa[t] = std::abs(dx * ddy - dy * ddx) / (speed * speed * speed);
    }
    return kappa;
}

CurvatureResult CurvatureAnalyzer::analyze(const NormalizedTrack& track, const CurvatureParams& params) const {
    if (params.smoothingWindow == 0) throw std::invalid_argument("smoothing window must be >= 1");
    if (!(params.binSeconds > 0.0)) throw std::invalid_argument("bin width must be > 0");
    if (!(track.frameRate > 0.0)) throw std::invalid_argument("frame rate must be > 0");

    const NormalizedLandmark& lm = track.require(params.landmark);
    const double fps = track.frameRate;

    const std::vector<double> xs = masked_moving_average(lm.x, lm.valid, params.smoothingWindow);
    const std::vector<double> ys = masked_moving_average(lm.y, lm.valid, params.smoothingWindow);

    CurvatureResult r;
    r.curvature.trialId = track.trialId;
    r.curvature.feature = "curvature";
    r.curvature.sampleRateHz = fps;
    r.curvature.parameters = {
        {"derivative_window", static_cast<double>(params.derivativeWindow)},
        {"smoothing_window", static_cast<double>(params.smoothingWindow)},
        {"min_speed", params.minSpeed},
        {"likelihood_threshold", track.likelihoodThreshold},
    };
    r.curvature.values = computeCurvature(xs, ys, lm.valid, params.derivativeWindow, 1.0 / fps, params.minSpeed);

    const std::size_t perBin = std::max<std::size_t>(1, static_cast<std::size_t>(std::llround(params.binSeconds * fps)));
    r.binnedCurvature = r.curvature;
    r.binnedCurvature.feature = "binned_curvature";
    r.binnedCurvature.sampleRateHz = 1.0 / params.binSeconds;
    r.binnedCurvature.parameters["bin_seconds"] = params.binSeconds;
    r.binnedCurvature.values = bin_means(r.curvature.values, perBin);

    r.meanCurvature = mean_of_defined(r.curvature.values);
    return r;
}

}  // namespace features
}  // namespace posescope
