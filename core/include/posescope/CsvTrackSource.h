#pragma once

#include "posescope/TrackSource.h"

#include <memory>
#include <string>

namespace posescope {

class TrialCatalog;

/**
 * CsvTrackSource: flat-file adapter
 *
 * The file of a trial is its metadata track reference (relative references
 * resolve against root), otherwise <root>/<trial id>.csv. Accepts a flat
 * "{landmark}_x,{landmark}_y,{landmark}_likelihood" header or the three-row
 * scorer/bodyparts/coords header written by DeepLabCut.
 */
class CsvTrackSource : public TrackSource {
  public:
    // Throws ConfigurationError when root is not a directory. catalog may be
    // null, in which case every id maps to <root>/<id>.csv at defaultFrameRate.
    CsvTrackSource(std::string root, std::shared_ptr<const TrialCatalog> catalog, double defaultFrameRate);

    CoordinateTrack fetch(const TrialId& trialId) const override;
    std::string describe() const override;

  private:
    std::string root_;
    std::shared_ptr<const TrialCatalog> catalog_;
    double defaultFrameRate_;
};

// Parses one track file. Throws TrialNotFound when the file cannot be read and
// MalformedSchema when the header has no complete landmark.
CoordinateTrack read_track_file(const std::string& path, const TrialId& trialId, double frameRate);

}  // namespace posescope
