#include "posescope/Utility.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace posescope {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}  // namespace

std::string feature_kind_to_string(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::MeanSpeed:
            return "mean_speed";
        case FeatureKind::TotalDistance:
            return "total_distance";
        case FeatureKind::VelocityPerMinute:
            return "velocity_per_min";
        case FeatureKind::StopCount:
            return "stop_count";
        case FeatureKind::MeanCurvature:
            return "mean_curvature";
        case FeatureKind::MeanMisalignment:
            return "mean_misalignment";
        case FeatureKind::MeanHeadBodyMisalignment:
            return "mean_head_body_misalignment";
        case FeatureKind::MeanTailBend:
            return "mean_tail_bend";
        case FeatureKind::MeanAngularSpeed:
            return "mean_angular_speed";
        case FeatureKind::TimeInCenter:
            return "time_in_center";
        case FeatureKind::TimeInCorners:
            return "time_in_corners";
        case FeatureKind::SpatialEntropy:
            return "spatial_entropy";
        case FeatureKind::AccelOutlierCount:
            return "accel_outlier_count";
        case FeatureKind::JerkOutlierCount:
            return "jerk_outlier_count";
    }
    return "mean_speed";
}

FeatureKind feature_kind_from_string(const std::string& value) {
    if (value == "mean_speed") {
        return FeatureKind::MeanSpeed;
    }
    if (value == "total_distance") {
        return FeatureKind::TotalDistance;
    }
    if (value == "velocity_per_min") {
        return FeatureKind::VelocityPerMinute;
    }
    if (value == "stop_count") {
        return FeatureKind::StopCount;
    }
    if (value == "mean_curvature") {
        return FeatureKind::MeanCurvature;
    }
    if (value == "mean_misalignment") {
        return FeatureKind::MeanMisalignment;
    }
    if (value == "mean_head_body_misalignment") {
        return FeatureKind::MeanHeadBodyMisalignment;
    }
    if (value == "mean_tail_bend") {
        return FeatureKind::MeanTailBend;
    }
    if (value == "mean_angular_speed") {
        return FeatureKind::MeanAngularSpeed;
    }
    if (value == "time_in_center") {
        return FeatureKind::TimeInCenter;
    }
    if (value == "time_in_corners") {
        return FeatureKind::TimeInCorners;
    }
    if (value == "spatial_entropy") {
        return FeatureKind::SpatialEntropy;
    }
    if (value == "accel_outlier_count") {
        return FeatureKind::AccelOutlierCount;
    }
    if (value == "jerk_outlier_count") {
        return FeatureKind::JerkOutlierCount;
    }
    throw std::invalid_argument("Unknown feature kind: " + value);
}

std::string sweep_parameter_to_string(SweepParameter parameter) {
    switch (parameter) {
        case SweepParameter::LikelihoodThreshold:
            return "likelihood_threshold";
        case SweepParameter::SmoothingWindow:
            return "smoothing_window";
        case SweepParameter::DerivativeWindow:
            return "derivative_window";
        case SweepParameter::TimeLimitSeconds:
            return "time_limit_s";
    }
    return "likelihood_threshold";
}

SweepParameter sweep_parameter_from_string(const std::string& value) {
    if (value == "likelihood_threshold") {
        return SweepParameter::LikelihoodThreshold;
    }
    if (value == "smoothing_window") {
        return SweepParameter::SmoothingWindow;
    }
    if (value == "derivative_window") {
        return SweepParameter::DerivativeWindow;
    }
    if (value == "time_limit_s") {
        return SweepParameter::TimeLimitSeconds;
    }
    throw std::invalid_argument("Unknown sweep parameter: " + value);
}

std::string trial_issue_kind_to_string(TrialIssueKind kind) {
    switch (kind) {
        case TrialIssueKind::TrialNotFound:
            return "TrialNotFound";
        case TrialIssueKind::MalformedSchema:
            return "MalformedSchema";
        case TrialIssueKind::InsufficientValidFrames:
            return "InsufficientValidFrames";
        case TrialIssueKind::NoArenaReference:
            return "NoArenaReference";
    }
    return "TrialNotFound";
}

Treatment treatment_from_cell(const std::optional<std::string>& cell) {
    if (!cell) return Treatment::none();
    const std::string value = trim(*cell);
    const std::string key = lower(value);
    if (key.empty() || key == "na" || key == "nan" || key == "none" || key == "null") {
        return Treatment::none();
    }
    return Treatment::named(value);
}

std::string treatment_to_string(const Treatment& treatment) {
    return treatment.isNone() ? "none" : treatment.label();
}

TreatmentFilter treatment_filter_from_string(const std::string& value) {
    const std::string key = lower(trim(value));
    if (key == "any" || key == "*") return TreatmentFilter::any();
    if (key == "none") return TreatmentFilter::none();
    return TreatmentFilter::named(trim(value));
}

void canonicalize_track(CoordinateTrack& track) {
    std::sort(track.landmarks.begin(), track.landmarks.end(),
              [](const LandmarkTrack& a, const LandmarkTrack& b) { return a.name < b.name; });
}

void drop_untracked_landmarks(CoordinateTrack& track) {
    auto untracked = [](const LandmarkTrack& lm) {
        for (std::size_t f = 0; f < lm.x.size(); ++f) {
            if (std::isfinite(lm.x[f]) || std::isfinite(lm.y[f])) return false;
        }
        return true;
    };
    track.landmarks.erase(std::remove_if(track.landmarks.begin(), track.landmarks.end(), untracked),
                          track.landmarks.end());
}

}  // namespace posescope
