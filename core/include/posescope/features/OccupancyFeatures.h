#pragma once

#include "../CoreContract.h"
#include "../PoseTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace posescope {
namespace features {

enum class RegionShape {
    Square,     // side = regionSize
    Circle      // diameter = regionSize
};

struct OccupancyParams {
    std::string landmark{"Midback"};
    RegionShape shape{RegionShape::Square};
    double regionSize{contract::DEFAULT_REGION_SIZE};
    std::size_t gridSize{contract::DEFAULT_OCCUPANCY_GRID};
    std::optional<double> timeLimitSeconds;
    double radialCenterX{0.0};
    double radialCenterY{1.0};
    double radialMax{contract::DEFAULT_RADIAL_MAX};
    std::size_t radialBins{contract::DEFAULT_RADIAL_BINS};
};

struct OccupancyResult {
    std::size_t validFrames{0};
    MaybeValue centerFraction;          // share of valid frames in the centre region
    MaybeValue cornerFraction;          // summed share over the four corner regions
    std::vector<double> grid;           // gridSize x gridSize probabilities, row = y
    MaybeValue spatialEntropy;          // bits
    std::vector<double> radialFractions;
};

/**
 * OccupancyAnalyzer: where in the unit arena a landmark spends its time
 *
 * Input: NormalizedTrack (arena units, validity flags)
 * Output: centre / corner occupancy, occupancy grid and its base-2 entropy,
 *         distribution of distances from a reference point
 *
 * Every share is taken over the valid frames within the time limit. A trial
 * without such a frame has all values missing and empty distributions.
 */
class OccupancyAnalyzer {
public:
    OccupancyAnalyzer() = default;

    /**
     * @throws MalformedSchema if the landmark is not tracked
     * @throws std::invalid_argument for a non-positive region size or radius,
     *         an empty grid / radial binning or a negative time limit
     */
    OccupancyResult analyze(const NormalizedTrack& track, const OccupancyParams& params) const;

    // Base-2 Shannon entropy of a probability vector; zero cells are skipped.
    static double entropyBits(const std::vector<double>& probabilities);
};

}  // namespace features
}  // namespace posescope
