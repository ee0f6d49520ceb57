#pragma once

#include "../CoreContract.h"
#include "../PoseTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace posescope {
namespace features {

struct MotionParams {
    std::string landmark{"Midback"};
    std::size_t smoothingWindow{1};                          // frames; 1 = no smoothing
    double binSeconds{contract::DEFAULT_BIN_SECONDS};
    std::optional<double> timeLimitSeconds;                  // truncate the trial first
    double minDurationSeconds{contract::MIN_MOTION_DURATION_SEC};
};

struct MotionResult {
    FeatureSeries speed;            // per frame, arena units / s; frame 0 missing
    FeatureSeries binnedSpeed;      // mean speed per bin
    FeatureSeries acceleration;     // per frame, arena units / s^2
    FeatureSeries jerk;             // per frame, arena units / s^3
    MaybeValue totalDistance;       // missing when no valid step exists
    MaybeValue velocityPerMinute;   // missing for trials shorter than minDurationSeconds
    std::size_t validSteps{0};
};

struct OutlierParams {
    std::size_t medianWindow{contract::OUTLIER_MEDIAN_WINDOW};
    double madMultiplier{contract::OUTLIER_MAD_MULTIPLIER};
    double zeroMadThreshold{contract::OUTLIER_ZERO_MAD_THRESHOLD};
};

struct StopParams {
    std::string landmark{"Midback"};
    double maxSpanX{0.05};          // arena units
    double maxSpanY{0.05};
    std::size_t minFrames{30};
};

struct StopSegment {
    std::size_t startFrame{0};      // inclusive
    std::size_t endFrame{0};        // inclusive
    double centerX{0.0};
    double centerY{0.0};
};

// Number of leading frames with f / fps <= timeLimitSeconds, clamped to
// frameCount; all frames when no limit is set.
std::size_t frames_within(std::size_t frameCount, double fps, std::optional<double> timeLimitSeconds);

/**
 * MotionAnalyzer: speed, distance and stopping points of one landmark
 *
 * Input: NormalizedTrack (arena units, validity flags)
 * Output: per-frame speed, per-bin mean speed, cumulative distance
 *
 * Speed at frame f uses frames f-1 and f and is defined only when both are
 * valid. Positions are smoothed first with a masked centred moving average.
 */
class MotionAnalyzer {
public:
    MotionAnalyzer() = default;

    /**
     * Compute the motion summary of params.landmark.
     * @throws MalformedSchema if the landmark is not tracked
     * @throws std::invalid_argument for a zero window, a non-positive bin
     *         width / frame rate or a negative time limit
     */
    MotionResult analyze(const NormalizedTrack& track, const MotionParams& params) const;

    /**
     * Stopping points: maximal runs of valid frames whose bounding box stays
     * within maxSpanX x maxSpanY, kept when at least minFrames long.
     * An invalid frame closes the current run.
     */
    std::vector<StopSegment> detectStops(const NormalizedTrack& track, const StopParams& params) const;

    // Moving-median outliers among the defined values of an acceleration or
    // jerk series, taken in frame order. Missing when no value is defined.
    MaybeValue countOutliers(const FeatureSeries& series, const OutlierParams& params) const;
};

}  // namespace features
}  // namespace posescope
