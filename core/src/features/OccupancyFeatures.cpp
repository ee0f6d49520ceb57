#include "posescope/features/OccupancyFeatures.h"
#include "posescope/features/MotionFeatures.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace posescope {
namespace features {

namespace {

struct Point {
    double x;
    double y;
};

constexpr Point kCenter{0.5, 0.5};
constexpr std::array<Point, 4> kCorners{{{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}}};

bool in_region(double x, double y, const Point& c, RegionShape shape, double half) {
    if (shape == RegionShape::Circle) {
        return std::hypot(x - c.x, y - c.y) <= half;
    }
    return std::abs(x - c.x) <= half && std::abs(y - c.y) <= half;
}

std::size_t cell_of(double v, std::size_t cells) {
    const double k = std::floor(v * static_cast<double>(cells));
    if (!(k > 0.0)) return 0;
    return std::min(cells - 1, static_cast<std::size_t>(k));
}

} // namespace

double OccupancyAnalyzer::entropyBits(const std::vector<double>& probabilities) {
    double h = 0.0;
    for (double p : probabilities) {
        if (p > 0.0) h -= p * std::log2(p);
    }
    return h;
}

OccupancyResult OccupancyAnalyzer::analyze(const NormalizedTrack& track, const OccupancyParams& params) const {
    if (!(params.regionSize > 0.0)) throw std::invalid_argument("region size must be > 0");
    if (params.gridSize == 0) throw std::invalid_argument("grid size must be >= 1");
    if (params.radialBins == 0) throw std::invalid_argument("radial bin count must be >= 1");
    if (!(params.radialMax > 0.0)) throw std::invalid_argument("radial maximum must be > 0");
    if (params.timeLimitSeconds && !(*params.timeLimitSeconds >= 0.0)) {
        throw std::invalid_argument("time limit must be >= 0");
    }
    if (params.timeLimitSeconds && !(track.frameRate > 0.0)) {
        throw std::invalid_argument("frame rate must be > 0");
    }

    const NormalizedLandmark& lm = track.require(params.landmark);
    const std::size_t n = frames_within(track.frameCount, track.frameRate, params.timeLimitSeconds);
    const double half = 0.5 * params.regionSize;
    const std::size_t g = params.gridSize;
    const double radialStep = params.radialMax / static_cast<double>(params.radialBins);

    std::size_t centerCount = 0;
    std::size_t cornerCount = 0;
    std::vector<std::size_t> cells(g * g, 0);
    std::vector<std::size_t> radial(params.radialBins, 0);

    OccupancyResult r;
    for (std::size_t f = 0; f < n; ++f) {
        if (!lm.valid[f]) continue;
        const double x = lm.x[f];
        const double y = lm.y[f];
        ++r.validFrames;

        if (in_region(x, y, kCenter, params.shape, half)) ++centerCount;
        for (const Point& c : kCorners) {
            if (in_region(x, y, c, params.shape, half)) ++cornerCount;
        }

        ++cells[cell_of(y, g) * g + cell_of(x, g)];

        const double d = std::hypot(x - params.radialCenterX, y - params.radialCenterY);
        const std::size_t bin = std::min(params.radialBins - 1, static_cast<std::size_t>(d / radialStep));
        ++radial[bin];
    }

    if (r.validFrames == 0) return r;

    const double total = static_cast<double>(r.validFrames);
    r.centerFraction = static_cast<double>(centerCount) / total;
    r.cornerFraction = static_cast<double>(cornerCount) / total;

    r.grid.resize(cells.size());
    std::transform(cells.begin(), cells.end(), r.grid.begin(),
                   [&](std::size_t c) { return static_cast<double>(c) / total; });
    r.spatialEntropy = entropyBits(r.grid);

    r.radialFractions.resize(radial.size());
    std::transform(radial.begin(), radial.end(), r.radialFractions.begin(),
                   [&](std::size_t c) { return static_cast<double>(c) / total; });
    return r;
}

}  // namespace features
}  // namespace posescope
