#include "posescope/TrackSource.h"
#include "posescope/Config.h"
#include "posescope/CsvTrackSource.h"
#include "posescope/Errors.h"
#include "posescope/SQLiteStore.h"
#include "posescope/TrialCatalog.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <unordered_map>

namespace posescope {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

FallbackTrackSource::FallbackTrackSource(std::unique_ptr<TrackSource> primary, std::unique_ptr<TrackSource> secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary)) {
    if (!secondary_) {
        throw std::invalid_argument("FallbackTrackSource requires a secondary source");
    }
}

CoordinateTrack FallbackTrackSource::fetch(const TrialId& trialId) const {
    if (primary_ && !primaryDown_.load()) {
        try {
            return primary_->fetch(trialId);
        } catch (const ConnectionUnavailable& e) {
            // Only the first worker to see the outage logs it.
            if (!primaryDown_.exchange(true)) {
                spdlog::warn("[TrackSource] {} unavailable ({}); serving from {}",
                             primary_->describe(), e.what(), secondary_->describe());
            }
        }
    }
    return secondary_->fetch(trialId);
}

std::string FallbackTrackSource::describe() const {
    if (!primary_) return secondary_->describe();
    return primary_->describe() + " -> " + secondary_->describe();
}

bool FallbackTrackSource::usingPrimary() const {
    return primary_ && !primaryDown_.load();
}

std::unique_ptr<TrackSource> make_track_source(const PipelineConfig& config,
                                               std::shared_ptr<const TrialCatalog> catalog) {
    // The file adapter is the guaranteed path: a missing root is batch-fatal.
    auto secondary = std::make_unique<CsvTrackSource>(config.fallback.root, std::move(catalog),
                                                      config.analysis.frameRate);

    std::unique_ptr<TrackSource> primary;
    if (!config.relational.databasePath.empty()) {
        try {
            primary = std::make_unique<SQLiteTrackSource>(config.relational.databasePath,
                                                          config.relational.poolSize,
                                                          config.relational.busyTimeoutMs,
                                                          config.analysis.frameRate);
        } catch (const ConnectionUnavailable& e) {
            spdlog::warn("[TrackSource] Relational store unavailable, using flat files only: {}", e.what());
        }
    } else {
        spdlog::info("[TrackSource] No relational store configured, using flat files only");
    }

    return std::make_unique<FallbackTrackSource>(std::move(primary), std::move(secondary));
}

std::shared_ptr<const TrialCatalog> load_catalog(const PipelineConfig& config) {
    if (!config.relational.databasePath.empty()) {
        try {
            return std::make_shared<const TrialCatalog>(
                TrialCatalog::load_from_sqlite(config.relational.databasePath, config.relational.busyTimeoutMs));
        } catch (const ConnectionUnavailable& e) {
            spdlog::warn("[Catalog] Relational store unavailable, reading metadata files: {}", e.what());
        }
    }

    const std::vector<std::string> files = config.resolvedMetadataFiles();
    if (files.empty()) {
        throw ConfigurationError("No trial metadata source: relational store unavailable and fallback.metadata is empty");
    }
    return std::make_shared<const TrialCatalog>(TrialCatalog::load_from_csv(files));
}

std::vector<std::string> landmarks_from_columns(const std::vector<std::string>& columns,
                                                const std::string& source) {
    constexpr unsigned kX = 1u, kY = 2u, kP = 4u;
    std::vector<std::string> order;
    std::unordered_map<std::string, unsigned> seen;

    auto note = [&](const std::string& name, unsigned bit) {
        auto [it, inserted] = seen.emplace(name, 0u);
        if (inserted) order.push_back(name);
        it->second |= bit;
    };

    for (const auto& col : columns) {
        if (ends_with(col, "_likelihood")) {
            note(col.substr(0, col.size() - 11), kP);
        } else if (ends_with(col, "_x")) {
            note(col.substr(0, col.size() - 2), kX);
        } else if (ends_with(col, "_y")) {
            note(col.substr(0, col.size() - 2), kY);
        }
    }

    for (const auto& name : order) {
        const unsigned mask = seen[name];
        if (mask != (kX | kY | kP)) {
            std::string missing;
            if (!(mask & kX)) missing += " " + name + "_x";
            if (!(mask & kY)) missing += " " + name + "_y";
            if (!(mask & kP)) missing += " " + name + "_likelihood";
            throw MalformedSchema("Track source " + source + " lacks column(s):" + missing);
        }
    }
    return order;
}

}  // namespace posescope
