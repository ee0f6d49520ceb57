#include "posescope/TrialCatalog.h"
#include "posescope/CsvReader.h"
#include "posescope/Errors.h"
#include "posescope/SQLiteStore.h"
#include "posescope/Utility.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace posescope {

namespace {

int column_index(const std::vector<std::string>& header, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = std::find(header.begin(), header.end(), name);
        if (it != header.end()) return static_cast<int>(it - header.begin());
    }
    return -1;
}

const std::optional<std::string>& cell_at(const std::vector<std::optional<std::string>>& row, int idx) {
    static const std::optional<std::string> kNull;
    if (idx < 0 || static_cast<std::size_t>(idx) >= row.size()) return kNull;
    return row[static_cast<std::size_t>(idx)];
}

}  // namespace

MetadataColumns MetadataColumns::resolve(const std::vector<std::string>& header, const std::string& source) {
    MetadataColumns c;
    c.id = column_index(header, {"id"});
    c.task = column_index(header, {"task"});
    c.modulation = column_index(header, {"modulation"});
    c.strain = column_index(header, {"strain", "genotype"});
    c.frameRate = column_index(header, {"frame_rate"});
    c.trackRef = column_index(header, {"track_path", "csv_file_path"});

    std::string missing;
    if (c.id < 0) missing += " id";
    if (c.task < 0) missing += " task";
    if (c.modulation < 0) missing += " modulation";
    if (c.strain < 0) missing += " strain";
    if (!missing.empty()) {
        throw MalformedSchema("Trial metadata " + source + " lacks required column(s):" + missing);
    }
    return c;
}

Trial trial_from_row(const MetadataColumns& columns,
                     const std::vector<std::optional<std::string>>& row,
                     const std::string& source) {
    const auto& id = cell_at(row, columns.id);
    if (!id || id->empty()) {
        throw MalformedSchema("Trial metadata " + source + " has a row without an id");
    }

    Trial trial;
    trial.id = *id;
    trial.task = cell_at(row, columns.task).value_or("");
    trial.treatment = treatment_from_cell(cell_at(row, columns.modulation));
    trial.strain = cell_at(row, columns.strain).value_or("");
    if (const auto& fps = cell_at(row, columns.frameRate)) {
        const auto parsed = parse_number(*fps);
        if (parsed && *parsed > 0.0) trial.frameRate = *parsed;
    }
    trial.trackRef = cell_at(row, columns.trackRef).value_or("");
    return trial;
}

TrialCatalog::TrialCatalog(std::vector<Trial> trials) : trials_(std::move(trials)) {
    index_.reserve(trials_.size());
    for (std::size_t i = 0; i < trials_.size(); ++i) {
        if (!index_.emplace(trials_[i].id, i).second) {
            throw MalformedSchema("Duplicate trial id in metadata: " + trials_[i].id);
        }
    }
}

TrialCatalog TrialCatalog::load_from_sqlite(const std::string& databasePath, int busyTimeoutMs) {
    SQLiteConnection conn = SQLiteConnection::open_read_only(databasePath, busyTimeoutMs);

    const std::vector<std::string> header = conn.column_names("trials");
    if (header.empty()) {
        throw MalformedSchema("Database " + databasePath + " has no 'trials' table");
    }
    const MetadataColumns columns = MetadataColumns::resolve(header, databasePath);

    std::vector<Trial> trials;
    conn.for_each_row("SELECT * FROM trials ORDER BY rowid;", {},
                      [&](const std::vector<std::optional<std::string>>& row) {
                          trials.push_back(trial_from_row(columns, row, databasePath));
                      });
    spdlog::info("[Catalog] Loaded {} trials from {}", trials.size(), databasePath);
    return TrialCatalog(std::move(trials));
}

TrialCatalog TrialCatalog::load_from_csv(const std::vector<std::string>& paths) {
    std::vector<Trial> trials;
    for (const auto& path : paths) {
        std::vector<CsvRow> rows;
        try {
            rows = read_delimited(path);
        } catch (const std::runtime_error& e) {
            throw ConfigurationError(e.what());
        }
        if (rows.empty()) {
            spdlog::warn("[Catalog] Metadata file {} is empty", path);
            continue;
        }
        const MetadataColumns columns = MetadataColumns::resolve(rows.front(), path);
        for (std::size_t r = 1; r < rows.size(); ++r) {
            std::vector<std::optional<std::string>> cells;
            cells.reserve(rows[r].size());
            for (auto& c : rows[r]) {
                if (c.empty()) {
                    cells.emplace_back(std::nullopt);
                } else {
                    cells.emplace_back(std::move(c));
                }
            }
            trials.push_back(trial_from_row(columns, cells, path));
        }
    }
    spdlog::info("[Catalog] Loaded {} trials from {} metadata file(s)", trials.size(), paths.size());
    return TrialCatalog(std::move(trials));
}

std::vector<TrialId> TrialCatalog::select(const ConditionFilter& filter) const {
    std::vector<TrialId> ids;
    for (const auto& trial : trials_) {
        if (filter.matches(trial)) ids.push_back(trial.id);
    }
    return ids;
}

std::optional<Trial> TrialCatalog::find(const TrialId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return trials_[it->second];
}

}  // namespace posescope
