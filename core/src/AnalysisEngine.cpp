#include "posescope/AnalysisEngine.h"
#include "posescope/Errors.h"
#include "posescope/SeriesMath.h"
#include "posescope/Utility.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace posescope {

namespace {

// Runs task(i) for i in [0, count) on up to `workers` threads. The first
// exception stops further dispatch and is rethrown once all threads joined.
void run_parallel(std::size_t count, std::size_t workers, const std::function<void(std::size_t)>& task) {
    if (count == 0) return;
    const std::size_t threads = std::max<std::size_t>(1, std::min(workers, count));

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr error;
    std::mutex errorMutex;

    auto worker = [&]() {
        while (!failed.load()) {
            const std::size_t i = next.fetch_add(1);
            if (i >= count) break;
            try {
                task(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!error) error = std::current_exception();
                failed.store(true);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    if (error) std::rethrow_exception(error);
}

TrialIssue make_issue(const TrialId& id, TrialIssueKind kind, std::string message) {
    TrialIssue issue;
    issue.trialId = id;
    issue.kind = kind;
    issue.message = std::move(message);
    return issue;
}

std::size_t window_from(double value, const char* name) {
    if (!(value >= 1.0) || std::floor(value) != value) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer");
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

EngineOptions EngineOptions::fromConfig(const AnalysisConfig& config) {
    EngineOptions options;
    options.workers = config.workers;
    options.cornerLandmarks = config.cornerLandmarks;
    options.extentLandmark = config.extentLandmark;
    return options;
}

FeatureRequest with_parameter(FeatureRequest request, SweepParameter parameter, double value) {
    switch (parameter) {
        case SweepParameter::LikelihoodThreshold:
            if (!(value >= 0.0 && value <= 1.0)) {
                throw std::invalid_argument("likelihood threshold must lie in [0,1]");
            }
            request.likelihoodThreshold = value;
            break;
        case SweepParameter::SmoothingWindow: {
            const std::size_t w = window_from(value, "smoothing window");
            request.motion.smoothingWindow = w;
            request.curvature.smoothingWindow = w;
            break;
        }
        case SweepParameter::DerivativeWindow:
            request.curvature.derivativeWindow = window_from(value, "derivative window");
            break;
        case SweepParameter::TimeLimitSeconds:
            if (!(value >= 0.0)) {
                throw std::invalid_argument("time limit must be >= 0");
            }
            request.motion.timeLimitSeconds = value;
            request.occupancy.timeLimitSeconds = value;
            break;
    }
    return request;
}

AnalysisEngine::AnalysisEngine(std::shared_ptr<const TrialCatalog> catalog,
                               std::shared_ptr<const TrackSource> source,
                               EngineOptions options)
    : catalog_(std::move(catalog)), source_(std::move(source)), options_(std::move(options)) {
    if (!catalog_ || !source_) {
        throw std::invalid_argument("AnalysisEngine requires a catalog and a track source");
    }
    if (options_.workers == 0) {
        throw std::invalid_argument("worker count must be >= 1");
    }
}

MaybeValue AnalysisEngine::computeFeature(const NormalizedTrack& track, const FeatureRequest& request) const {
    switch (request.kind) {
        case FeatureKind::MeanSpeed:
            return mean_of_defined(motionAnalyzer_.analyze(track, request.motion).speed.values);
        case FeatureKind::TotalDistance:
            return motionAnalyzer_.analyze(track, request.motion).totalDistance;
        case FeatureKind::VelocityPerMinute:
            return motionAnalyzer_.analyze(track, request.motion).velocityPerMinute;
        case FeatureKind::StopCount: {
            const NormalizedLandmark& lm = track.require(request.stops.landmark);
            if (std::none_of(lm.valid.begin(), lm.valid.end(), [](std::uint8_t v) { return v != 0; })) {
                return std::nullopt;
            }
            return static_cast<double>(motionAnalyzer_.detectStops(track, request.stops).size());
        }
        case FeatureKind::MeanCurvature:
            return curvatureAnalyzer_.analyze(track, request.curvature).meanCurvature;
        case FeatureKind::MeanMisalignment:
            return mean_of_defined(angleAnalyzer_.computeMisalignment(track, request.angle).values);
        case FeatureKind::MeanHeadBodyMisalignment:
            return mean_of_defined(angleAnalyzer_.computeHeadBodyMisalignment(track, request.angle).values);
        case FeatureKind::MeanTailBend:
            return mean_of_defined(angleAnalyzer_.computeTailBend(track, request.angle).values);
        case FeatureKind::MeanAngularSpeed:
            return mean_of_defined(angleAnalyzer_.computeAngularSpeed(track, request.angle).values);
        case FeatureKind::TimeInCenter:
            return occupancyAnalyzer_.analyze(track, request.occupancy).centerFraction;
        case FeatureKind::TimeInCorners:
            return occupancyAnalyzer_.analyze(track, request.occupancy).cornerFraction;
        case FeatureKind::SpatialEntropy:
            return occupancyAnalyzer_.analyze(track, request.occupancy).spatialEntropy;
        case FeatureKind::AccelOutlierCount:
            return motionAnalyzer_.countOutliers(motionAnalyzer_.analyze(track, request.motion).acceleration,
                                                 request.outliers);
        case FeatureKind::JerkOutlierCount:
            return motionAnalyzer_.countOutliers(motionAnalyzer_.analyze(track, request.motion).jerk,
                                                 request.outliers);
    }
    return std::nullopt;
}

TrialOutcome AnalysisEngine::analyzeTrack(const CoordinateTrack& track, const FeatureRequest& request) const {
    TrialOutcome outcome;
    outcome.trialId = track.trialId;

    const auto arena = resolve_arena(track, options_.cornerLandmarks, options_.extentLandmark,
                                     request.likelihoodThreshold);
    if (!arena) {
        outcome.issue = make_issue(track.trialId, TrialIssueKind::NoArenaReference,
                                   "no usable corner markers or extent landmark");
        return outcome;
    }

    const NormalizedTrack normalized = normalizer_.normalize(track, *arena, request.likelihoodThreshold);
    try {
        outcome.value = computeFeature(normalized, request);
    } catch (const MalformedSchema& e) {
        outcome.issue = make_issue(track.trialId, TrialIssueKind::MalformedSchema, e.what());
        return outcome;
    }

    if (!outcome.value) {
        outcome.issue = make_issue(track.trialId, TrialIssueKind::InsufficientValidFrames,
                                   "no defined " + feature_kind_to_string(request.kind) + " value");
    }
    return outcome;
}

std::vector<TrialId> AnalysisEngine::collectIds(const std::vector<GroupDefinition>& groups) const {
    std::vector<TrialId> ids;
    std::unordered_set<TrialId> seen;
    for (const auto& group : groups) {
        for (auto& id : catalog_->select(group.filter)) {
            if (seen.insert(id).second) ids.push_back(std::move(id));
        }
    }
    return ids;
}

std::vector<AnalysisEngine::FetchedTrial> AnalysisEngine::fetchAll(const std::vector<TrialId>& ids) const {
    std::vector<FetchedTrial> fetched(ids.size());
    run_parallel(ids.size(), options_.workers, [&](std::size_t i) {
        FetchedTrial& slot = fetched[i];
        slot.trialId = ids[i];
        try {
            slot.track = source_->fetch(ids[i]);
        } catch (const TrialNotFound& e) {
            slot.issue = make_issue(ids[i], TrialIssueKind::TrialNotFound, e.what());
        } catch (const MalformedSchema& e) {
            slot.issue = make_issue(ids[i], TrialIssueKind::MalformedSchema, e.what());
        }
    });
    return fetched;
}

std::vector<TrialOutcome> AnalysisEngine::analyzeAll(const std::vector<FetchedTrial>& trials,
                                                     const FeatureRequest& request) const {
    std::vector<TrialOutcome> outcomes(trials.size());
    run_parallel(trials.size(), options_.workers, [&](std::size_t i) {
        const FetchedTrial& trial = trials[i];
        if (!trial.track) {
            outcomes[i].trialId = trial.trialId;
            outcomes[i].issue = trial.issue;
            return;
        }
        outcomes[i] = analyzeTrack(*trial.track, request);
    });
    return outcomes;
}

std::vector<TrialOutcome> AnalysisEngine::evaluate(const std::vector<TrialId>& ids, const FeatureRequest& request) const {
    return analyzeAll(fetchAll(ids), request);
}

void AnalysisEngine::aggregate(const std::vector<GroupDefinition>& groups,
                               const std::vector<TrialOutcome>& outcomes,
                               const FeatureRequest& request,
                               const std::string& parameter,
                               MaybeValue parameterValue,
                               BatchReport& report) const {
    std::unordered_map<TrialId, const TrialOutcome*> byId;
    for (const auto& outcome : outcomes) {
        byId.emplace(outcome.trialId, &outcome);
        if (outcome.issue) {
            spdlog::warn("[Analysis] Trial {} excluded ({}): {}", outcome.trialId,
                         trial_issue_kind_to_string(outcome.issue->kind), outcome.issue->message);
            report.issues.push_back(*outcome.issue);
        } else {
            ++report.trialsAnalyzed;
        }
    }

    // Group values keep catalog order
    std::vector<std::vector<double>> values(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        for (const auto& id : catalog_->select(groups[g].filter)) {
            auto it = byId.find(id);
            if (it != byId.end() && it->second->value) values[g].push_back(*it->second->value);
        }
    }

    const std::string feature = feature_kind_to_string(request.kind);
    for (std::size_t g = 1; g < groups.size(); ++g) {
        GroupStatRow row;
        row.feature = feature;
        row.parameter = parameter;
        row.parameterValue = parameterValue;
        row.stat = stats_.compareGroups(groups[0].label, values[0], groups[g].label, values[g]);
        if (!row.stat.comparison.defined()) {
            spdlog::warn("[Analysis] {} vs {} on {}: comparison undefined (n = {} / {})", groups[0].label,
                         groups[g].label, feature, row.stat.first.n, row.stat.second.n);
        }
        report.rows.push_back(std::move(row));
    }
}

BatchReport AnalysisEngine::compare(const FeatureRequest& request, const std::vector<GroupDefinition>& groups) const {
    if (groups.size() < 2) {
        throw std::invalid_argument("compare needs at least two groups");
    }
    const std::vector<TrialId> ids = collectIds(groups);
    spdlog::info("[Analysis] {}: {} trial(s) across {} group(s), {} worker(s)",
                 feature_kind_to_string(request.kind), ids.size(), groups.size(), options_.workers);

    BatchReport report;
    aggregate(groups, evaluate(ids, request), request, {}, std::nullopt, report);
    spdlog::info("[Analysis] {} trial(s) analyzed, {} excluded", report.trialsAnalyzed, report.issues.size());
    return report;
}

BatchReport AnalysisEngine::sweep(const FeatureRequest& base,
                                  SweepParameter parameter,
                                  const std::vector<double>& values,
                                  const std::vector<GroupDefinition>& groups) const {
    if (groups.size() < 2) {
        throw std::invalid_argument("sweep needs at least two groups");
    }
    // Validate every value before any work is done
    std::vector<FeatureRequest> requests;
    requests.reserve(values.size());
    for (double v : values) requests.push_back(with_parameter(base, parameter, v));

    const std::vector<TrialId> ids = collectIds(groups);
    const std::string name = sweep_parameter_to_string(parameter);
    spdlog::info("[Analysis] Sweep of {} over {} value(s), {} trial(s)", name, values.size(), ids.size());

    const std::vector<FetchedTrial> fetched = fetchAll(ids);

    BatchReport report;
    for (std::size_t k = 0; k < values.size(); ++k) {
        BatchReport step;
        aggregate(groups, analyzeAll(fetched, requests[k]), requests[k], name, values[k], step);
        report.rows.insert(report.rows.end(), step.rows.begin(), step.rows.end());
        report.issues.insert(report.issues.end(), step.issues.begin(), step.issues.end());
        report.trialsAnalyzed += step.trialsAnalyzed;
        spdlog::info("[Analysis] {} = {}: {} trial(s) analyzed, {} excluded", name, values[k], step.trialsAnalyzed,
                     step.issues.size());
    }
    return report;
}

}  // namespace posescope
