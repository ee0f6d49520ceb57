#pragma once

#include "../CoreContract.h"
#include "../PoseTypes.h"

#include <array>
#include <string>

namespace posescope {
namespace features {

struct AngleParams {
    std::string head{"Head"};
    std::string neck{"Neck"};
    std::string tail{"Tailbase"};
    std::string motionLandmark{"Midback"};
    std::array<std::string, 3> bendLandmarks{{"Midback", "Lowerback", "Tailbase"}};
    double minDisplacement{contract::MIN_DIRECTION_DISPLACEMENT};   // arena units per frame
};

struct AngleResult {
    FeatureSeries misalignment;          // deg, [0, 180]
    FeatureSeries headBodyMisalignment;  // deg, [0, 180]
    FeatureSeries tailBend;              // deg, 180 = straight
    FeatureSeries angularSpeed;          // deg / s
};

/**
 * AngleAnalyzer: body orientation features
 *
 * The body vector runs tail -> head. A frame is missing unless every landmark
 * it uses is valid; each method throws MalformedSchema when one of its
 * landmarks is not tracked at all.
 */
class AngleAnalyzer {
public:
    AngleAnalyzer() = default;

    // All four series; requires every landmark in params.
    AngleResult analyze(const NormalizedTrack& track, const AngleParams& params) const;

    // Angle between the body vector and the displacement of the motion
    // landmark from frame f-1 to f. Frame 0 is missing.
    FeatureSeries computeMisalignment(const NormalizedTrack& track, const AngleParams& params) const;

    // Angle between tail -> head and neck -> head.
    FeatureSeries computeHeadBodyMisalignment(const NormalizedTrack& track, const AngleParams& params) const;

    // Interior angle at the middle bend landmark.
    FeatureSeries computeTailBend(const NormalizedTrack& track, const AngleParams& params) const;

    // |change of body heading| between consecutive frames, wrapped to
    // (-180, 180] before taking the magnitude, times the frame rate.
    FeatureSeries computeAngularSpeed(const NormalizedTrack& track, const AngleParams& params) const;
};

}  // namespace features
}  // namespace posescope
