#include "posescope/features/AngleFeatures.h"

#include <algorithm>
#include <cmath>
#include <optional>

namespace posescope {
namespace features {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kRadToDeg = 180.0 / kPi;
constexpr double kMinVectorLength = 1e-12;

struct Vec2 {
    double x;
    double y;
};

Vec2 vec(const NormalizedLandmark& from, const NormalizedLandmark& to, std::size_t f) {
    return {to.x[f] - from.x[f], to.y[f] - from.y[f]};
}

// Unsigned angle between two vectors in degrees, [0, 180]
std::optional<double> angle_between(const Vec2& a, const Vec2& b) {
    const double la = std::hypot(a.x, a.y);
    const double lb = std::hypot(b.x, b.y);
    if (la < kMinVectorLength || lb < kMinVectorLength) return std::nullopt;
    const double c = std::clamp((a.x * b.x + a.y * b.y) / (la * lb), -1.0, 1.0);
    return std::acos(c) * kRadToDeg;
}

FeatureSeries make_series(const NormalizedTrack& track, const char* feature) {
    FeatureSeries s;
    s.trialId = track.trialId;
    s.feature = feature;
    s.sampleRateHz = track.frameRate;
    s.parameters["likelihood_threshold"] = track.likelihoodThreshold;
    s.values.assign(track.frameCount, std::nullopt);
    return s;
}

} // namespace

FeatureSeries AngleAnalyzer::computeMisalignment(const NormalizedTrack& track, const AngleParams& params) const {
    const NormalizedLandmark& head = track.require(params.head);
    const NormalizedLandmark& tail = track.require(params.tail);
    const NormalizedLandmark& motion = track.require(params.motionLandmark);

    FeatureSeries s = make_series(track, "misalignment");
    s.parameters["min_displacement"] = params.minDisplacement;
    for (std::size_t f = 1; f < track.frameCount; ++f) {
        if (!head.valid[f] || !tail.valid[f] || !motion.valid[f - 1] || !motion.valid[f]) continue;
        const Vec2 step{motion.x[f] - motion.x[f - 1], motion.y[f] - motion.y[f - 1]};
        if (std::hypot(step.x, step.y) < params.minDisplacement) continue;
        s.values[f] = angle_between(vec(tail, head, f), step);
    }
    return s;
}

FeatureSeries AngleAnalyzer::computeHeadBodyMisalignment(const NormalizedTrack& track,
                                                         const AngleParams& params) const {
    const NormalizedLandmark& head = track.require(params.head);
    const NormalizedLandmark& neck = track.require(params.neck);
    const NormalizedLandmark& tail = track.require(params.tail);

    FeatureSeries s = make_series(track, "head_body_misalignment");
    for (std::size_t f = 0; f < track.frameCount; ++f) {
        if (!head.valid[f] || !neck.valid[f] || !tail.valid[f]) continue;
        s.values[f] = angle_between(vec(tail, head, f), vec(neck, head, f));
    }
    return s;
}

FeatureSeries AngleAnalyzer::computeTailBend(const NormalizedTrack& track, const AngleParams& params) const {
    const NormalizedLandmark& a = track.require(params.bendLandmarks[0]);
    const NormalizedLandmark& mid = track.require(params.bendLandmarks[1]);
    const NormalizedLandmark& b = track.require(params.bendLandmarks[2]);

    FeatureSeries s = make_series(track, "tail_bend");
    for (std::size_t f = 0; f < track.frameCount; ++f) {
        if (!a.valid[f] || !mid.valid[f] || !b.valid[f]) continue;
        s.values[f] = angle_between(vec(mid, a, f), vec(mid, b, f));
    }
    return s;
}

FeatureSeries AngleAnalyzer::computeAngularSpeed(const NormalizedTrack& track, const AngleParams& params) const {
    const NormalizedLandmark& head = track.require(params.head);
    const NormalizedLandmark& tail = track.require(params.tail);

    FeatureSeries s = make_series(track, "angular_speed");
    std::optional<double> prevHeading;
    for (std::size_t f = 0; f < track.frameCount; ++f) {
        std::optional<double> heading;
        if (head.valid[f] && tail.valid[f]) {
            const Vec2 body = vec(tail, head, f);
            if (std::hypot(body.x, body.y) >= kMinVectorLength) heading = std::atan2(body.y, body.x);
        }
        if (heading && prevHeading) {
            double d = *heading - *prevHeading;
            while (d > kPi) d -= 2.0 * kPi;
            while (d <= -kPi) d += 2.0 * kPi;
            s.values[f] = std::abs(d) * kRadToDeg * track.frameRate;
        }
        prevHeading = heading;
    }
    return s;
}

AngleResult AngleAnalyzer::analyze(const NormalizedTrack& track, const AngleParams& params) const {
    AngleResult r;
    r.misalignment = computeMisalignment(track, params);
    r.headBodyMisalignment = computeHeadBodyMisalignment(track, params);
    r.tailBend = computeTailBend(track, params);
    r.angularSpeed = computeAngularSpeed(track, params);
    return r;
}

} // namespace features
} // namespace posescope
