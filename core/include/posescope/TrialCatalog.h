#pragma once

#include "posescope/PoseTypes.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace posescope {

/**
 * TrialCatalog: in-memory view of the trial metadata table
 *
 * Catalog order is the order rows were read (rowid for SQLite, file then line
 * order for flat files) and is preserved by select(), so aggregation order is
 * reproducible.
 */
class TrialCatalog {
  public:
    TrialCatalog() = default;

    // Throws MalformedSchema on duplicate ids.
    explicit TrialCatalog(std::vector<Trial> trials);

    // Table "trials" of a SQLite database; throws ConnectionUnavailable when the
    // database cannot be opened, MalformedSchema when a required column is absent.
    static TrialCatalog load_from_sqlite(const std::string& databasePath, int busyTimeoutMs);

    // One or more delimited files sharing the metadata schema, concatenated.
    static TrialCatalog load_from_csv(const std::vector<std::string>& paths);

    std::vector<TrialId> select(const ConditionFilter& filter) const;
    std::optional<Trial> find(const TrialId& id) const;

    const std::vector<Trial>& trials() const { return trials_; }
    std::size_t size() const { return trials_.size(); }

  private:
    std::vector<Trial> trials_;
    std::unordered_map<TrialId, std::size_t> index_;
};

// Builds a Trial from a header/row pair of a metadata file. Exposed for the
// SQLite loader, which reads the same column set. Cells are optional: an empty
// optional is a NULL.
struct MetadataColumns {
    int id{-1};
    int task{-1};
    int modulation{-1};
    int strain{-1};
    int frameRate{-1};
    int trackRef{-1};

    // Accepts "genotype" for strain and "csv_file_path" for track_path.
    static MetadataColumns resolve(const std::vector<std::string>& header, const std::string& source);
};

Trial trial_from_row(const MetadataColumns& columns,
                     const std::vector<std::optional<std::string>>& row,
                     const std::string& source);

}  // namespace posescope
