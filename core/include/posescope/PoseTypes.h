#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace posescope {

using TrialId = std::string;

// Missing values are explicit: an empty optional means "no data", never 0.
using MaybeValue = std::optional<double>;

// ========== Treatment ==========
// Sum type {Named(label), None}. None is the untreated/control condition and is
// a category of its own, not an empty label.
class Treatment {
  public:
    static Treatment none() { return Treatment(); }
    static Treatment named(std::string label) { return Treatment(std::move(label)); }

    bool isNone() const { return !label_.has_value(); }
    const std::string& label() const;  // throws std::logic_error when isNone()

    bool operator==(const Treatment& other) const { return label_ == other.label_; }
    bool operator!=(const Treatment& other) const { return !(*this == other); }

  private:
    Treatment() = default;
    explicit Treatment(std::string label) : label_(std::move(label)) {}

    std::optional<std::string> label_;
};

// ========== Trial metadata ==========
struct Trial {
    TrialId id;
    std::string task;
    Treatment treatment{Treatment::none()};
    std::string strain;                 // strain / genotype / cohort
    std::optional<double> frameRate;    // fps; empty -> configured default
    std::string trackRef;               // path or key of the coordinate track, may be empty
};

// ========== Condition filter ==========
class TreatmentFilter {
  public:
    enum class Kind { Any, None, Named };

    static TreatmentFilter any() { return TreatmentFilter(Kind::Any, {}); }
    static TreatmentFilter none() { return TreatmentFilter(Kind::None, {}); }
    static TreatmentFilter named(std::string label) { return TreatmentFilter(Kind::Named, std::move(label)); }

    Kind kind() const { return kind_; }
    const std::string& label() const { return label_; }
    bool matches(const Treatment& treatment) const;

  private:
    TreatmentFilter(Kind kind, std::string label) : kind_(kind), label_(std::move(label)) {}

    Kind kind_;
    std::string label_;
};

struct ConditionFilter {
    std::vector<std::string> tasks;        // empty -> any task
    TreatmentFilter treatment{TreatmentFilter::any()};
    std::optional<std::string> strain;     // empty -> any strain
    std::vector<TrialId> excludedIds;      // known-bad trials

    bool matches(const Trial& trial) const;
};

// ========== Coordinate tracks ==========
struct LandmarkTrack {
    std::string name;
    std::vector<double> x;              // pixels
    std::vector<double> y;
    std::vector<double> likelihood;     // [0,1]; 0 for empty cells
};

struct CoordinateTrack {
    TrialId trialId;
    double frameRate{0.0};
    std::size_t frameCount{0};
    std::vector<LandmarkTrack> landmarks;   // sorted by name

    const LandmarkTrack* find(const std::string& name) const;
};

struct NormalizedLandmark {
    std::string name;
    std::vector<double> x;              // arena units; NaN where invalid
    std::vector<double> y;
    std::vector<std::uint8_t> valid;    // 1 = usable sample
};

struct NormalizedTrack {
    TrialId trialId;
    double frameRate{0.0};
    std::size_t frameCount{0};
    double likelihoodThreshold{0.0};
    std::vector<NormalizedLandmark> landmarks;

    const NormalizedLandmark* find(const std::string& name) const;
    // Like find(), but throws MalformedSchema naming the trial when absent.
    const NormalizedLandmark& require(const std::string& name) const;
};

// ========== Derived series ==========
struct FeatureSeries {
    TrialId trialId;
    std::string feature;                           // e.g. "speed", "curvature"
    std::map<std::string, double> parameters;      // window, threshold, bin width...
    double sampleRateHz{0.0};                      // frames/s, or 1/binSeconds for binned series
    std::vector<MaybeValue> values;

    std::size_t definedCount() const;
};

// ========== Group statistics ==========
struct GroupSummary {
    std::string label;
    std::size_t n{0};
    MaybeValue mean;
    MaybeValue standardDeviation;   // sample SD (n-1)
    MaybeValue standardError;
};

struct GroupComparison {
    MaybeValue tStatistic;          // sign follows (first - second)
    MaybeValue degreesOfFreedom;    // Welch-Satterthwaite
    MaybeValue pValue;              // two-tailed
    MaybeValue effectSize;          // Cohen's d

    bool defined() const { return tStatistic.has_value() && pValue.has_value(); }
};

struct GroupStat {
    GroupSummary first;
    GroupSummary second;
    GroupComparison comparison;
};

// ========== Trial-level scalar features ==========
enum class FeatureKind {
    MeanSpeed,              // mean of per-frame speed (arena units / s)
    TotalDistance,          // cumulative distance (arena units)
    VelocityPerMinute,      // total distance / duration, per minute
    StopCount,              // number of stopping points
    MeanCurvature,          // mean of defined kappa(t)
    MeanMisalignment,       // body vs motion direction (deg)
    MeanHeadBodyMisalignment,
    MeanTailBend,           // angle at the middle bend landmark (deg)
    MeanAngularSpeed,       // body heading change (deg / s)
    TimeInCenter,           // share of valid frames in the centre region
    TimeInCorners,          // share of valid frames in the corner regions
    SpatialEntropy,         // occupancy grid entropy (bits)
    AccelOutlierCount,      // moving-median outliers of acceleration
    JerkOutlierCount
};

// Parameters a sweep can vary
enum class SweepParameter {
    LikelihoodThreshold,
    SmoothingWindow,        // motion and curvature pre-smoothing, frames
    DerivativeWindow,       // curvature half-width h, frames
    TimeLimitSeconds
};

// ========== Batch bookkeeping ==========
enum class TrialIssueKind {
    TrialNotFound,
    MalformedSchema,
    InsufficientValidFrames,
    NoArenaReference
};

struct TrialIssue {
    TrialId trialId;
    TrialIssueKind kind{TrialIssueKind::TrialNotFound};
    std::string message;
};

}  // namespace posescope
