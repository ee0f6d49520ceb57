#pragma once

#include "posescope/PoseTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace posescope {

struct Point2 {
    double x{0.0};
    double y{0.0};
};

/**
 * AffineTransform: u = a*x + b*y + c, v = d*x + e*y + f
 */
class AffineTransform {
  public:
    AffineTransform() = default;  // identity

    // Least-squares fit of from[i] -> to[i]; needs >= 3 non-collinear points.
    // Throws std::invalid_argument otherwise.
    static AffineTransform fit(const std::vector<Point2>& from, const std::vector<Point2>& to);

    // Maps the box [xmin,xmax] x [ymin,ymax] onto the unit square.
    static AffineTransform fromBox(double xmin, double ymin, double xmax, double ymax);

    Point2 apply(const Point2& p) const;

  private:
    double a_{1.0}, b_{0.0}, c_{0.0};
    double d_{0.0}, e_{1.0}, f_{0.0};
};

enum class ArenaSource { Markers, Extent, Bounds };

struct ArenaReference {
    AffineTransform transform;
    ArenaSource source{ArenaSource::Bounds};
    std::size_t markersUsed{0};
};

// Corner markers in order TR, TL, BL, BR (unit-square targets (1,0), (0,0),
// (0,1), (1,1)). Each marker is located by the median of its valid positions
// over the leading ARENA_MARKER_TRAINING_FRACTION of the frames. Returns
// nullopt when fewer than ARENA_MIN_MARKERS markers are usable; throws
// std::invalid_argument when the usable markers are collinear.
std::optional<ArenaReference> arena_from_markers(const CoordinateTrack& track,
                                                 const std::vector<std::string>& cornerLandmarks,
                                                 double likelihoodThreshold);

// Percentile box of one landmark's valid positions. Returns nullopt when the
// landmark is absent or never valid; throws std::invalid_argument when the
// box has no area.
std::optional<ArenaReference> arena_from_extent(const CoordinateTrack& track,
                                                const std::string& landmark,
                                                double likelihoodThreshold);

ArenaReference arena_from_bounds(double xmin, double ymin, double xmax, double ymax);

// Markers first, extent second; nullopt when neither gives a usable frame.
std::optional<ArenaReference> resolve_arena(const CoordinateTrack& track,
                                            const std::vector<std::string>& cornerLandmarks,
                                            const std::string& extentLandmark,
                                            double likelihoodThreshold);

/**
 * CoordinateNormalizer: raw pixels -> arena units, with quality flags
 *
 * A sample is valid iff both coordinates are finite and its likelihood is
 * >= the threshold. Invalid samples keep their slot with NaN coordinates;
 * nothing is interpolated.
 */
class CoordinateNormalizer {
  public:
    // Throws std::invalid_argument when likelihoodThreshold is outside [0,1].
    NormalizedTrack normalize(const CoordinateTrack& track,
                              const ArenaReference& arena,
                              double likelihoodThreshold) const;
};

}  // namespace posescope
