#include "posescope/PoseTypes.h"
#include "posescope/Errors.h"

#include <algorithm>
#include <stdexcept>

namespace posescope {

const std::string& Treatment::label() const {
    if (!label_) {
        throw std::logic_error("Treatment::label() called on the untreated (None) treatment");
    }
    return *label_;
}

bool TreatmentFilter::matches(const Treatment& treatment) const {
    switch (kind_) {
        case Kind::Any:
            return true;
        case Kind::None:
            return treatment.isNone();
        case Kind::Named:
            return !treatment.isNone() && treatment.label() == label_;
    }
    return false;
}

bool ConditionFilter::matches(const Trial& trial) const {
    if (!tasks.empty() && std::find(tasks.begin(), tasks.end(), trial.task) == tasks.end()) {
        return false;
    }
    if (strain && trial.strain != *strain) {
        return false;
    }
    if (std::find(excludedIds.begin(), excludedIds.end(), trial.id) != excludedIds.end()) {
        return false;
    }
    return treatment.matches(trial.treatment);
}

const LandmarkTrack* CoordinateTrack::find(const std::string& name) const {
    for (const auto& lm : landmarks) {
        if (lm.name == name) return &lm;
    }
    return nullptr;
}

const NormalizedLandmark* NormalizedTrack::find(const std::string& name) const {
    for (const auto& lm : landmarks) {
        if (lm.name == name) return &lm;
    }
    return nullptr;
}

const NormalizedLandmark& NormalizedTrack::require(const std::string& name) const {
    if (const auto* lm = find(name)) return *lm;
    throw MalformedSchema("Trial " + trialId + " has no landmark '" + name + "'");
}

std::size_t FeatureSeries::definedCount() const {
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(), [](const MaybeValue& v) { return v.has_value(); }));
}

}  // namespace posescope
