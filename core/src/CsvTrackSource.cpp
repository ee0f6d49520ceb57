#include "posescope/CsvTrackSource.h"
#include "posescope/CsvReader.h"
#include "posescope/Errors.h"
#include "posescope/TrialCatalog.h"
#include "posescope/Utility.h"

#include <algorithm>
#include <filesystem>
#include <limits>

namespace posescope {

namespace fs = std::filesystem;

namespace {

bool is_dlc_header(const std::vector<CsvRow>& rows) {
    if (rows.size() < 3) return false;
    auto first = [&](std::size_t r) { return rows[r].empty() ? std::string() : rows[r][0]; };
    return first(0) == "scorer" && first(1) == "bodyparts" && first(2) == "coords";
}

const std::string& cell(const CsvRow& row, int idx) {
    static const std::string kEmpty;
    if (idx < 0 || static_cast<std::size_t>(idx) >= row.size()) return kEmpty;
    return row[static_cast<std::size_t>(idx)];
}

int index_of(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

}  // namespace

CsvTrackSource::CsvTrackSource(std::string root, std::shared_ptr<const TrialCatalog> catalog, double defaultFrameRate)
    : root_(std::move(root)), catalog_(std::move(catalog)), defaultFrameRate_(defaultFrameRate) {
    std::error_code ec;
    if (root_.empty() || !fs::is_directory(root_, ec)) {
        throw ConfigurationError("Fallback directory does not exist: " + root_);
    }
}

std::string CsvTrackSource::describe() const {
    return "csv:" + root_;
}

CoordinateTrack CsvTrackSource::fetch(const TrialId& trialId) const {
    fs::path path = fs::path(root_) / (trialId + ".csv");
    double frameRate = defaultFrameRate_;

    if (catalog_) {
        const auto trial = catalog_->find(trialId);
        if (!trial) {
            throw TrialNotFound(trialId, "not in trial metadata");
        }
        if (!trial->trackRef.empty()) {
            fs::path ref(trial->trackRef);
            path = ref.is_relative() ? fs::path(root_) / ref : ref;
        }
        frameRate = trial->frameRate.value_or(defaultFrameRate_);
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw TrialNotFound(trialId, "no track file at " + path.string());
    }
    return read_track_file(path.string(), trialId, frameRate);
}

CoordinateTrack read_track_file(const std::string& path, const TrialId& trialId, double frameRate) {
    std::vector<CsvRow> rows;
    try {
        rows = read_delimited(path);
    } catch (const std::runtime_error& e) {
        throw TrialNotFound(trialId, e.what());
    }
    if (rows.empty()) {
        throw MalformedSchema("Track file " + path + " is empty");
    }

    // Both layouts are reduced to one "{landmark}_{coord}" header.
    std::vector<std::string> header;
    std::size_t firstData = 1;
    if (is_dlc_header(rows)) {
        const CsvRow& parts = rows[1];
        const CsvRow& coords = rows[2];
        header.resize(std::max(parts.size(), coords.size()));
        for (std::size_t c = 1; c < header.size(); ++c) {
            const std::string& part = c < parts.size() ? parts[c] : std::string();
            const std::string& coord = c < coords.size() ? coords[c] : std::string();
            if (!part.empty() && !coord.empty()) header[c] = part + "_" + coord;
        }
        firstData = 3;
    } else {
        header = rows.front();
    }

    const std::vector<std::string> names = landmarks_from_columns(header, path);
    if (names.empty()) {
        throw MalformedSchema("Track file " + path + " has no landmark columns");
    }

    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    CoordinateTrack track;
    track.trialId = trialId;
    track.frameRate = frameRate;
    track.frameCount = rows.size() - firstData;
    track.landmarks.reserve(names.size());

    for (const auto& name : names) {
        const int ix = index_of(header, name + "_x");
        const int iy = index_of(header, name + "_y");
        const int ip = index_of(header, name + "_likelihood");

        LandmarkTrack lm;
        lm.name = name;
        lm.x.reserve(track.frameCount);
        lm.y.reserve(track.frameCount);
        lm.likelihood.reserve(track.frameCount);
        for (std::size_t r = firstData; r < rows.size(); ++r) {
            const auto x = parse_number(cell(rows[r], ix));
            const auto y = parse_number(cell(rows[r], iy));
            const auto p = parse_number(cell(rows[r], ip));
            lm.x.push_back(x.value_or(kNaN));
            lm.y.push_back(y.value_or(kNaN));
            // An empty cell makes the whole sample unusable.
            lm.likelihood.push_back(x && y && p ? *p : 0.0);
        }
        track.landmarks.push_back(std::move(lm));
    }

    drop_untracked_landmarks(track);
    canonicalize_track(track);
    return track;
}

}  // namespace posescope
