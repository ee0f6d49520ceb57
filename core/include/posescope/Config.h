#pragma once

#include "posescope/CoreContract.h"

#include <cstddef>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace posescope {

struct RelationalConfig {
    std::string databasePath;                                   // empty -> relational store disabled
    int busyTimeoutMs{contract::DEFAULT_BUSY_TIMEOUT_MS};
    std::size_t poolSize{contract::DEFAULT_POOL_SIZE};
};

struct FallbackConfig {
    std::string root;                                           // directory of flat-file tracks
    std::vector<std::string> metadataFiles;                     // relative paths resolve against root
};

struct AnalysisConfig {
    double frameRate{contract::DEFAULT_FRAME_RATE_HZ};
    std::size_t workers{contract::DEFAULT_WORKERS};
    double likelihoodThreshold{contract::DEFAULT_LIKELIHOOD_THRESHOLD};
    std::vector<std::string> cornerLandmarks{"Corner1", "Corner2", "Corner3", "Corner4"};
    std::string extentLandmark{"Midback"};                      // extent fallback; empty disables it
};

/**
 * PipelineConfig: explicit configuration for one batch run
 *
 * Replaces module-level connection accessors: the value is built once,
 * validated, and handed to the catalog/track-source factories.
 */
struct PipelineConfig {
    RelationalConfig relational;
    FallbackConfig fallback;
    AnalysisConfig analysis;
    std::string logLevel{"info"};

    // Metadata file paths with relative entries resolved against fallback.root.
    std::vector<std::string> resolvedMetadataFiles() const;
};

// Throws ConfigurationError if the file cannot be read or a value has the wrong type.
PipelineConfig load_config(const std::string& path);
PipelineConfig config_from_yaml(const YAML::Node& root);

// Batch-fatal checks: the fallback root must exist and be a directory, the pool
// and worker counts must be positive, the threshold must lie in [0,1].
void validate_config(const PipelineConfig& config);

}  // namespace posescope
