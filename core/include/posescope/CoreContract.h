#pragma once

/**
 * CoreContract.h - PoseScope pipeline constants
 *
 * Defaults and numerical tolerances shared by the data-access layer, the
 * normalizer and the feature computers. Values that callers are expected to
 * sweep (likelihood threshold, window sizes) are only DEFAULTS here; every
 * computer takes them as explicit parameters.
 *
 * VERSION: 1.0.0
 */

#include <cstddef>

namespace posescope {
namespace contract {

// ============================================================================
// Timeline
// ============================================================================

/**
 * DEFAULT_FRAME_RATE_HZ - Frame rate assumed when trial metadata has none
 *
 * Frame index f maps to time t = f / frame_rate.
 */
constexpr double DEFAULT_FRAME_RATE_HZ = 30.0;

/**
 * DEFAULT_BIN_SECONDS - Width of the time bins used for per-bin aggregates
 *
 * 60 s gives the "per minute" view used by the motion and curvature summaries.
 */
constexpr double DEFAULT_BIN_SECONDS = 60.0;

// ============================================================================
// Quality filtering
// ============================================================================

/**
 * DEFAULT_LIKELIHOOD_THRESHOLD - Minimum detector confidence for a valid sample
 *
 * Typical sweep range: [0.3, 0.95]. Samples with likelihood < threshold are
 * flagged invalid and never repaired.
 */
constexpr double DEFAULT_LIKELIHOOD_THRESHOLD = 0.5;

/**
 * ARENA_MARKER_TRAINING_FRACTION - Leading share of frames used to locate
 * arena corner markers (the tail end of a recording often has the
 * experimenter's hands in view).
 */
constexpr double ARENA_MARKER_TRAINING_FRACTION = 0.9;

/**
 * ARENA_EXTENT_QUANTILE_LO / HI - Percentile box used by the extent fallback
 */
constexpr double ARENA_EXTENT_QUANTILE_LO = 0.01;
constexpr double ARENA_EXTENT_QUANTILE_HI = 0.99;

/**
 * ARENA_MIN_MARKERS - Corner markers needed for an affine fit (3 is exact,
 * 4 is least squares)
 */
constexpr std::size_t ARENA_MIN_MARKERS = 3;

// ============================================================================
// Feature computers
// ============================================================================

/**
 * STATIONARY_SPEED_EPS - Speed (arena units / s) below which the curvature
 * denominator is treated as numerically zero
 */
constexpr double STATIONARY_SPEED_EPS = 1e-9;

/**
 * MIN_DIRECTION_DISPLACEMENT - Displacement (arena units) below which a
 * motion direction is undefined
 */
constexpr double MIN_DIRECTION_DISPLACEMENT = 1e-9;

/**
 * MIN_MOTION_DURATION_SEC - Shortest trial for which a per-minute velocity
 * is reported
 */
constexpr double MIN_MOTION_DURATION_SEC = 5.0;

/**
 * TIME_LIMIT_EPSILON - Slack (frames) when locating the last frame at or
 * before a time limit, so that limit * fps landing just under an integer
 * still keeps that frame
 */
constexpr double TIME_LIMIT_EPSILON = 1e-9;

// ============================================================================
// Occupancy and motion outliers
// ============================================================================

/**
 * DEFAULT_REGION_SIZE - Side (square) or diameter (circle) of the centre and
 * corner regions of the unit arena
 */
constexpr double DEFAULT_REGION_SIZE = 0.5;

/**
 * DEFAULT_OCCUPANCY_GRID - Cells per axis of the occupancy grid used for
 * spatial entropy
 */
constexpr std::size_t DEFAULT_OCCUPANCY_GRID = 10;

constexpr std::size_t DEFAULT_RADIAL_BINS = 10;
constexpr double DEFAULT_RADIAL_MAX = 1.0;

/**
 * Motion outliers: |v - moving median| > OUTLIER_MAD_MULTIPLIER * MAD, with
 * OUTLIER_ZERO_MAD_THRESHOLD as the threshold when the MAD is exactly 0
 */
constexpr std::size_t OUTLIER_MEDIAN_WINDOW = 5;
constexpr double OUTLIER_MAD_MULTIPLIER = 3.0;
constexpr double OUTLIER_ZERO_MAD_THRESHOLD = 0.001;

// ============================================================================
// Relational store
// ============================================================================

constexpr int DEFAULT_BUSY_TIMEOUT_MS = 250;
constexpr std::size_t DEFAULT_POOL_SIZE = 4;
constexpr std::size_t DEFAULT_WORKERS = 4;

constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace posescope
