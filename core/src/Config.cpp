#include "posescope/Config.h"
#include "posescope/Errors.h"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace posescope {

namespace {

template <typename T>
void read_if_present(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) {
        out = node[key].as<T>();
    }
}

}  // namespace

std::vector<std::string> PipelineConfig::resolvedMetadataFiles() const {
    std::vector<std::string> out;
    out.reserve(fallback.metadataFiles.size());
    for (const auto& file : fallback.metadataFiles) {
        std::filesystem::path p(file);
        if (p.is_relative() && !fallback.root.empty()) {
            p = std::filesystem::path(fallback.root) / p;
        }
        out.push_back(p.string());
    }
    return out;
}

PipelineConfig config_from_yaml(const YAML::Node& root) {
    PipelineConfig config;
    try {
        const YAML::Node relational = root["relational"];
        read_if_present(relational, "database", config.relational.databasePath);
        read_if_present(relational, "busy_timeout_ms", config.relational.busyTimeoutMs);
        read_if_present(relational, "pool_size", config.relational.poolSize);

        const YAML::Node fallback = root["fallback"];
        read_if_present(fallback, "root", config.fallback.root);
        read_if_present(fallback, "metadata", config.fallback.metadataFiles);

        const YAML::Node analysis = root["analysis"];
        read_if_present(analysis, "frame_rate", config.analysis.frameRate);
        read_if_present(analysis, "workers", config.analysis.workers);
        read_if_present(analysis, "likelihood_threshold", config.analysis.likelihoodThreshold);
        read_if_present(analysis, "corner_landmarks", config.analysis.cornerLandmarks);
        read_if_present(analysis, "extent_landmark", config.analysis.extentLandmark);

        const YAML::Node logging = root["logging"];
        read_if_present(logging, "level", config.logLevel);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }
    return config;
}

PipelineConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load configuration from " + path + ": " + e.what());
    }
    spdlog::info("[Config] Loaded configuration from: {}", path);
    return config_from_yaml(root);
}

void validate_config(const PipelineConfig& config) {
    namespace fs = std::filesystem;
    if (config.fallback.root.empty()) {
        throw ConfigurationError("fallback.root is not set");
    }
    std::error_code ec;
    if (!fs::is_directory(config.fallback.root, ec)) {
        throw ConfigurationError("Fallback directory does not exist: " + config.fallback.root);
    }
    if (config.relational.poolSize == 0) {
        throw ConfigurationError("relational.pool_size must be >= 1");
    }
    if (config.analysis.workers == 0) {
        throw ConfigurationError("analysis.workers must be >= 1");
    }
    if (!(config.analysis.frameRate > 0.0)) {
        throw ConfigurationError("analysis.frame_rate must be > 0");
    }
    const double theta = config.analysis.likelihoodThreshold;
    if (!(theta >= 0.0 && theta <= 1.0)) {
        throw ConfigurationError("analysis.likelihood_threshold must lie in [0,1]");
    }
}

}  // namespace posescope
