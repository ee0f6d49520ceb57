#include "posescope/features/MotionFeatures.h"
#include "posescope/SeriesMath.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace posescope {
namespace features {

namespace {

FeatureSeries make_series(const NormalizedTrack& track, const char* feature, const MotionParams& params, double rateHz) {
    FeatureSeries s;
    s.trialId = track.trialId;
    s.feature = feature;
    s.sampleRateHz = rateHz;
    s.parameters["smoothing_window"] = static_cast<double>(params.smoothingWindow);
    s.parameters["likelihood_threshold"] = track.likelihoodThreshold;
    if (params.timeLimitSeconds) s.parameters["time_limit_s"] = *params.timeLimitSeconds;
    return s;
}

} // namespace

std::size_t frames_within(std::size_t frameCount, double fps, std::optional<double> timeLimitSeconds) {
    if (!timeLimitSeconds) return frameCount;
    // frame f is at t = f / fps; the frame at exactly t = limit is kept
    const double last = std::floor(*timeLimitSeconds * fps + contract::TIME_LIMIT_EPSILON);
    return std::min(frameCount, static_cast<std::size_t>(last) + 1);
}

MotionResult MotionAnalyzer::analyze(const NormalizedTrack& track, const MotionParams& params) const {
    if (params.smoothingWindow == 0) throw std::invalid_argument("smoothing window must be >= 1");
    if (!(params.binSeconds > 0.0)) throw std::invalid_argument("bin width must be > 0");
    if (!(track.frameRate > 0.0)) throw std::invalid_argument("frame rate must be > 0");
    if (params.timeLimitSeconds && !(*params.timeLimitSeconds >= 0.0)) {
        throw std::invalid_argument("time limit must be >= 0");
    }

    const NormalizedLandmark& lm = track.require(params.landmark);
    const double fps = track.frameRate;

    const std::size_t n = frames_within(track.frameCount, fps, params.timeLimitSeconds);

    const std::vector<double> x0(lm.x.begin(), lm.x.begin() + n);
    const std::vector<double> y0(lm.y.begin(), lm.y.begin() + n);
    const std::vector<std::uint8_t> valid(lm.valid.begin(), lm.valid.begin() + n);
    const std::vector<double> xs = masked_moving_average(x0, valid, params.smoothingWindow);
    const std::vector<double> ys = masked_moving_average(y0, valid, params.smoothingWindow);

    MotionResult r;
    r.speed = make_series(track, "speed", params, fps);
    r.speed.values.assign(n, std::nullopt);

    double distance = 0.0;
    for (std::size_t f = 1; f < n; ++f) {
        if (!valid[f - 1] || !valid[f]) continue;
        const double step = std::hypot(xs[f] - xs[f - 1], ys[f] - ys[f - 1]);
        r.speed.values[f] = step * fps;
        distance += step;
        ++r.validSteps;
    }
    if (r.validSteps > 0) r.totalDistance = distance;

    // Acceleration: change of speed between consecutive defined samples
    r.acceleration = make_series(track, "acceleration", params, fps);
    r.acceleration.values.assign(n, std::nullopt);
    for (std::size_t f = 1; f < n; ++f) {
        const auto& a = r.speed.values[f - 1];
        const auto& b = r.speed.values[f];
        if (a && b) r.acceleration.values[f] = (*b - *a) * fps;
    }

    r.jerk = make_series(track, "jerk", params, fps);
    r.jerk.values.assign(n, std::nullopt);
    for (std::size_t f = 1; f < n; ++f) {
        const auto& a = r.acceleration.values[f - 1];
        const auto& b = r.acceleration.values[f];
        if (a && b) r.jerk.values[f] = (*b - *a) * fps;
    }

    const std::size_t perBin = std::max<std::size_t>(1, static_cast<std::size_t>(std::llround(params.binSeconds * fps)));
    r.binnedSpeed = make_series(track, "binned_speed", params, 1.0 / params.binSeconds);
    r.binnedSpeed.parameters["bin_seconds"] = params.binSeconds;
    r.binnedSpeed.values = bin_means(r.speed.values, perBin);

    if (n >= 2 && r.totalDistance) {
        const double duration = static_cast<double>(n - 1) / fps;
        if (duration >= params.minDurationSeconds && duration > 0.0) {
            r.velocityPerMinute = *r.totalDistance / duration * 60.0;
        }
    }
    return r;
}

std::vector<StopSegment> MotionAnalyzer::detectStops(const NormalizedTrack& track, const StopParams& params) const {
    if (params.minFrames == 0) throw std::invalid_argument("minFrames must be >= 1");
    if (!(params.maxSpanX >= 0.0) || !(params.maxSpanY >= 0.0)) {
        throw std::invalid_argument("stop span must be >= 0");
    }
    const NormalizedLandmark& lm = track.require(params.landmark);

    std::vector<StopSegment> stops;
    bool open = false;
    std::size_t start = 0;
    double x0 = 0.0, x1 = 0.0, y0 = 0.0, y1 = 0.0;

    auto close = [&](std::size_t endExclusive) {
        if (open && endExclusive - start >= params.minFrames) {
            stops.push_back({start, endExclusive - 1, 0.5 * (x0 + x1), 0.5 * (y0 + y1)});
        }
        open = false;
    };

    for (std::size_t f = 0; f < track.frameCount; ++f) {
        if (!lm.valid[f]) {
            close(f);
            continue;
        }
        const double x = lm.x[f];
        const double y = lm.y[f];
        if (open) {
            const double nx0 = std::min(x0, x), nx1 = std::max(x1, x);
            const double ny0 = std::min(y0, y), ny1 = std::max(y1, y);
            if (nx1 - nx0 <= params.maxSpanX && ny1 - ny0 <= params.maxSpanY) {
                x0 = nx0; x1 = nx1; y0 = ny0; y1 = ny1;
                continue;
            }
            close(f);
        }
        open = true;
        start = f;
        x0 = x1 = x;
        y0 = y1 = y;
    }
    close(track.frameCount);
    return stops;
}

MaybeValue MotionAnalyzer::countOutliers(const FeatureSeries& series, const OutlierParams& params) const {
    if (params.medianWindow == 0) throw std::invalid_argument("median window must be >= 1");
    if (!(params.madMultiplier > 0.0)) throw std::invalid_argument("MAD multiplier must be > 0");

    const std::vector<double> values = defined_values(series.values);
    if (values.empty()) return std::nullopt;
    return static_cast<double>(
        count_moving_median_outliers(values, params.medianWindow, params.madMultiplier, params.zeroMadThreshold));
}

} // namespace features
} // namespace posescope
