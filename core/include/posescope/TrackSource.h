#pragma once

#include "posescope/PoseTypes.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace posescope {

struct PipelineConfig;
class TrialCatalog;

/**
 * TrackSource: resolves a trial identifier to its raw coordinate track
 *
 * fetch() throws TrialNotFound when the trial has no track, MalformedSchema
 * when the track lacks required columns, and ConnectionUnavailable when the
 * backing store cannot be reached. Implementations must be safe to call from
 * several worker threads at once.
 */
class TrackSource {
  public:
    virtual ~TrackSource() = default;

    virtual CoordinateTrack fetch(const TrialId& trialId) const = 0;
    virtual std::string describe() const = 0;
};

/**
 * FallbackTrackSource: relational first, flat files second
 *
 * A ConnectionUnavailable from the primary is logged and the request is served
 * by the secondary; after the first such failure the primary is no longer
 * consulted for this batch. TrialNotFound and MalformedSchema propagate.
 */
class FallbackTrackSource : public TrackSource {
  public:
    // primary may be null (store disabled or unreachable at construction).
    FallbackTrackSource(std::unique_ptr<TrackSource> primary, std::unique_ptr<TrackSource> secondary);

    CoordinateTrack fetch(const TrialId& trialId) const override;
    std::string describe() const override;

    bool usingPrimary() const;

  private:
    std::unique_ptr<TrackSource> primary_;
    std::unique_ptr<TrackSource> secondary_;
    mutable std::atomic<bool> primaryDown_{false};
};

/**
 * Builds the composed source for a batch run: tries to open the relational
 * store named in config (ConnectionUnavailable is logged, not raised) and
 * pairs it with the flat-file adapter rooted at config.fallback.root.
 * Throws ConfigurationError when the fallback root does not exist.
 */
std::unique_ptr<TrackSource> make_track_source(const PipelineConfig& config,
                                               std::shared_ptr<const TrialCatalog> catalog);

/**
 * Loads trial metadata relational-first (table "trials"), falling back to the
 * configured metadata files when the store is unavailable.
 */
std::shared_ptr<const TrialCatalog> load_catalog(const PipelineConfig& config);

// Splits "{landmark}_{x|y|likelihood}" column names into landmark names in
// first-seen order; other columns are ignored. Throws MalformedSchema when a
// landmark lacks one of its three columns.
std::vector<std::string> landmarks_from_columns(const std::vector<std::string>& columns,
                                                const std::string& source);

}  // namespace posescope
