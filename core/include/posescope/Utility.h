#pragma once

#include "posescope/PoseTypes.h"

#include <optional>
#include <string>

namespace posescope {

std::string feature_kind_to_string(FeatureKind kind);
FeatureKind feature_kind_from_string(const std::string& value);

std::string sweep_parameter_to_string(SweepParameter parameter);
SweepParameter sweep_parameter_from_string(const std::string& value);

std::string trial_issue_kind_to_string(TrialIssueKind kind);

// Boundary parser for metadata cells: NULL/empty/"NA"/"NaN"/"None"/"null" -> None.
Treatment treatment_from_cell(const std::optional<std::string>& cell);
std::string treatment_to_string(const Treatment& treatment);  // "none" for None

// "any", "none" or a label.
TreatmentFilter treatment_filter_from_string(const std::string& value);

// Orders landmarks by name so every source yields the same in-memory shape.
void canonicalize_track(CoordinateTrack& track);

// Removes landmarks without a single finite coordinate (columns present in the
// source but never filled for this trial).
void drop_untracked_landmarks(CoordinateTrack& track);

}  // namespace posescope
