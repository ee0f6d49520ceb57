#pragma once

#include "posescope/Config.h"
#include "posescope/CoordinateNormalizer.h"
#include "posescope/GroupStats.h"
#include "posescope/PoseTypes.h"
#include "posescope/TrackSource.h"
#include "posescope/TrialCatalog.h"
#include "posescope/features/AngleFeatures.h"
#include "posescope/features/CurvatureFeatures.h"
#include "posescope/features/MotionFeatures.h"
#include "posescope/features/OccupancyFeatures.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace posescope {

// One trial-level scalar and the parameters of the computers behind it
struct FeatureRequest {
    FeatureKind kind{FeatureKind::MeanSpeed};
    double likelihoodThreshold{contract::DEFAULT_LIKELIHOOD_THRESHOLD};
    features::MotionParams motion;
    features::StopParams stops;
    features::CurvatureParams curvature;
    features::AngleParams angle;
    features::OccupancyParams occupancy;
    features::OutlierParams outliers;
};

struct GroupDefinition {
    std::string label;
    ConditionFilter filter;
};

struct TrialOutcome {
    TrialId trialId;
    MaybeValue value;
    std::optional<TrialIssue> issue;    // set whenever value is missing
};

struct GroupStatRow {
    std::string feature;
    std::string parameter;              // empty outside a sweep
    MaybeValue parameterValue;
    GroupStat stat;
};

struct BatchReport {
    std::vector<GroupStatRow> rows;
    std::vector<TrialIssue> issues;     // one entry per trial left out
    std::size_t trialsAnalyzed{0};
};

struct EngineOptions {
    std::size_t workers{contract::DEFAULT_WORKERS};
    std::vector<std::string> cornerLandmarks{"Corner1", "Corner2", "Corner3", "Corner4"};
    std::string extentLandmark{"Midback"};

    static EngineOptions fromConfig(const AnalysisConfig& config);
};

/**
 * AnalysisEngine: batch driver
 *
 * Orchestrates: TrialCatalog -> TrackSource -> CoordinateNormalizer ->
 * feature computers -> GroupwiseStatsEngine
 *
 * Trials are processed by a bounded pool of worker threads. A trial that
 * cannot be fetched, lacks a landmark or has too few valid frames becomes a
 * TrialIssue and the batch continues; statistics are computed only after
 * every worker has joined.
 */
class AnalysisEngine {
  public:
    AnalysisEngine(std::shared_ptr<const TrialCatalog> catalog,
                   std::shared_ptr<const TrackSource> source,
                   EngineOptions options);

    // Scalar feature of one normalized track; missing when the computers
    // produce no defined value. Throws MalformedSchema for an untracked landmark.
    MaybeValue computeFeature(const NormalizedTrack& track, const FeatureRequest& request) const;

    // Per-trial values in the order of ids.
    std::vector<TrialOutcome> evaluate(const std::vector<TrialId>& ids, const FeatureRequest& request) const;

    /**
     * Compare groups[1..] against groups[0] (the reference group).
     * @throws std::invalid_argument when fewer than two groups are given
     */
    BatchReport compare(const FeatureRequest& request, const std::vector<GroupDefinition>& groups) const;

    /**
     * Same comparison for each value of one parameter. Tracks are fetched
     * once and re-analysed per value; rows are ordered by value, then group.
     */
    BatchReport sweep(const FeatureRequest& base,
                      SweepParameter parameter,
                      const std::vector<double>& values,
                      const std::vector<GroupDefinition>& groups) const;

  private:
    struct FetchedTrial {
        TrialId trialId;
        std::optional<CoordinateTrack> track;
        std::optional<TrialIssue> issue;
    };

    std::vector<TrialId> collectIds(const std::vector<GroupDefinition>& groups) const;
    std::vector<FetchedTrial> fetchAll(const std::vector<TrialId>& ids) const;
    std::vector<TrialOutcome> analyzeAll(const std::vector<FetchedTrial>& trials, const FeatureRequest& request) const;
    TrialOutcome analyzeTrack(const CoordinateTrack& track, const FeatureRequest& request) const;
    void aggregate(const std::vector<GroupDefinition>& groups,
                   const std::vector<TrialOutcome>& outcomes,
                   const FeatureRequest& request,
                   const std::string& parameter,
                   MaybeValue parameterValue,
                   BatchReport& report) const;

    std::shared_ptr<const TrialCatalog> catalog_;
    std::shared_ptr<const TrackSource> source_;
    EngineOptions options_;

    CoordinateNormalizer normalizer_;
    features::MotionAnalyzer motionAnalyzer_;
    features::CurvatureAnalyzer curvatureAnalyzer_;
    features::AngleAnalyzer angleAnalyzer_;
    features::OccupancyAnalyzer occupancyAnalyzer_;
    GroupwiseStatsEngine stats_;
};

// Copy of request with one sweep parameter set. Window parameters must be
// positive integers; throws std::invalid_argument otherwise.
FeatureRequest with_parameter(FeatureRequest request, SweepParameter parameter, double value);

}  // namespace posescope
