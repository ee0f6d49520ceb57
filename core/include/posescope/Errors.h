#pragma once

#include <stdexcept>
#include <string>

namespace posescope {

// Base of every error the pipeline raises on purpose.
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Relational store unreachable (missing file, not a database, locked past the
// busy timeout). Recovered by FallbackTrackSource, never fatal.
class ConnectionUnavailable : public Error {
  public:
    using Error::Error;
};

// No metadata row or no track data for the requested trial.
class TrialNotFound : public Error {
  public:
    explicit TrialNotFound(const std::string& trialId, const std::string& detail = {})
        : Error("Trial not found: " + trialId + (detail.empty() ? "" : " (" + detail + ")")),
          trialId_(trialId) {}

    const std::string& trialId() const noexcept { return trialId_; }

  private:
    std::string trialId_;
};

// A required column is absent from a track or metadata source.
class MalformedSchema : public Error {
  public:
    using Error::Error;
};

// Batch-level misconfiguration (fallback root missing, unreadable config).
class ConfigurationError : public Error {
  public:
    using Error::Error;
};

}  // namespace posescope
