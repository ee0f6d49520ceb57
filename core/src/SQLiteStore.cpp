#include "posescope/SQLiteStore.h"

#include "posescope/Errors.h"
#include "posescope/Utility.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

namespace posescope {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw Error(message);
    }
}

StmtPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw Error(std::string(sqlite3_errmsg(db)) + " [" + sql + "]");
    }
    return StmtPtr(stmt, &sqlite3_finalize);
}

// SQLITE_BUSY / SQLITE_LOCKED after the busy timeout count as the store being
// unavailable; anything else is a query error.
[[noreturn]] void throw_step_error(sqlite3* db, int rc, const std::string& what) {
    const std::string message = what + ": " + sqlite3_errmsg(db);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        throw ConnectionUnavailable(message);
    }
    throw Error(message);
}

std::string quote_identifier(const std::string& name) {
    return "\"" + name + "\"";
}

void require_identifier(const std::string& name) {
    bool ok = !name.empty();
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') ok = false;
    }
    if (!ok) {
        throw MalformedSchema("Landmark name '" + name + "' is not usable as a column name");
    }
}

double column_or_nan(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sqlite3_column_double(stmt, col);
}

void bind_optional_double(sqlite3_stmt* stmt, int idx, double value) {
    if (std::isfinite(value)) {
        sqlite3_bind_double(stmt, idx, value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// SQLiteConnection
// ---------------------------------------------------------------------------

SQLiteConnection SQLiteConnection::open_read_only(const std::string& path, int busyTimeoutMs) {
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw ConnectionUnavailable("Failed to open SQLite database at " + path + ": " + message);
    }
    sqlite3_busy_timeout(db, busyTimeoutMs);

    // Opening is lazy; a probe query surfaces "file is not a database" and locks.
    char* err = nullptr;
    if (sqlite3_exec(db, "SELECT count(*) FROM sqlite_master;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        sqlite3_close(db);
        throw ConnectionUnavailable("SQLite database at " + path + " is unusable: " + message);
    }
    return SQLiteConnection(db);
}

SQLiteConnection SQLiteConnection::open_read_write(const std::string& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw ConnectionUnavailable("Failed to open SQLite database at " + path + ": " + message);
    }
    return SQLiteConnection(db);
}

SQLiteConnection::~SQLiteConnection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

std::vector<std::string> SQLiteConnection::column_names(const std::string& table) const {
    std::vector<std::string> names;
    auto stmt = prepare_or_throw(db_, "PRAGMA table_info(" + table + ");");
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* name = sqlite3_column_text(stmt.get(), 1);
        if (name) names.emplace_back(reinterpret_cast<const char*>(name));
    }
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, "PRAGMA table_info(" + table + ")");
    return names;
}

void SQLiteConnection::for_each_row(const std::string& sql,
                                    const std::vector<std::string>& params,
                                    const std::function<void(const std::vector<std::optional<std::string>>&)>& fn) const {
    auto stmt = prepare_or_throw(db_, sql);
    for (std::size_t i = 0; i < params.size(); ++i) {
        sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
    }

    const int ncols = sqlite3_column_count(stmt.get());
    std::vector<std::optional<std::string>> row(static_cast<std::size_t>(ncols));
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        for (int c = 0; c < ncols; ++c) {
            const unsigned char* text = sqlite3_column_text(stmt.get(), c);
            if (text) {
                row[static_cast<std::size_t>(c)] = std::string(reinterpret_cast<const char*>(text));
            } else {
                row[static_cast<std::size_t>(c)].reset();
            }
        }
        fn(row);
    }
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, sql);
}

// ---------------------------------------------------------------------------
// SQLiteConnectionPool
// ---------------------------------------------------------------------------

SQLiteConnectionPool::SQLiteConnectionPool(const std::string& path, std::size_t size, int busyTimeoutMs)
    : size_(size == 0 ? 1 : size) {
    idle_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        idle_.push_back(SQLiteConnection::open_read_only(path, busyTimeoutMs));
    }
}

SQLiteConnectionPool::Lease::Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.conn_.reset();
}

SQLiteConnectionPool::Lease::~Lease() {
    if (conn_ && conn_->handle()) {
        pool_->release(std::move(*conn_));
    }
}

SQLiteConnectionPool::Lease SQLiteConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !idle_.empty(); });
    SQLiteConnection conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(*this, std::move(conn));
}

void SQLiteConnectionPool::release(SQLiteConnection conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

// ---------------------------------------------------------------------------
// SQLiteTrackSource
// ---------------------------------------------------------------------------

SQLiteTrackSource::SQLiteTrackSource(const std::string& path,
                                     std::size_t poolSize,
                                     int busyTimeoutMs,
                                     double defaultFrameRate)
    : path_(path), defaultFrameRate_(defaultFrameRate), pool_(path, poolSize, busyTimeoutMs) {
    spdlog::info("[SQLite] Opened {} with {} pooled connection(s)", path_, pool_.size());
}

std::string SQLiteTrackSource::describe() const {
    return "sqlite:" + path_;
}

CoordinateTrack SQLiteTrackSource::fetch(const TrialId& trialId) const {
    auto conn = pool_.acquire();
    sqlite3* db = conn->handle();

    const std::vector<std::string> columns = conn->column_names("track_frames");
    if (columns.empty()) {
        throw MalformedSchema("Database " + path_ + " has no 'track_frames' table");
    }
    const std::vector<std::string> names = landmarks_from_columns(columns, path_);
    if (names.empty()) {
        throw MalformedSchema("Table track_frames in " + path_ + " has no landmark columns");
    }

    CoordinateTrack track;
    track.trialId = trialId;
    track.frameRate = defaultFrameRate_;

    const std::vector<std::string> trialColumns = conn->column_names("trials");
    if (std::find(trialColumns.begin(), trialColumns.end(), "frame_rate") != trialColumns.end()) {
        auto stmt = prepare_or_throw(db, "SELECT frame_rate FROM trials WHERE id = ?;");
        sqlite3_bind_text(stmt.get(), 1, trialId.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            const double fps = column_or_nan(stmt.get(), 0);
            if (std::isfinite(fps) && fps > 0.0) track.frameRate = fps;
        } else if (rc != SQLITE_DONE) {
            throw_step_error(db, rc, "frame_rate lookup for trial " + trialId);
        }
    }

    std::string sql = "SELECT ";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += quote_identifier(names[i] + "_x") + ", " + quote_identifier(names[i] + "_y") + ", " +
               quote_identifier(names[i] + "_likelihood");
    }
    sql += " FROM track_frames WHERE trial_id = ? ORDER BY frame;";

    auto stmt = prepare_or_throw(db, sql);
    sqlite3_bind_text(stmt.get(), 1, trialId.c_str(), -1, SQLITE_TRANSIENT);

    track.landmarks.resize(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) track.landmarks[i].name = names[i];

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        for (std::size_t i = 0; i < names.size(); ++i) {
            const int base = static_cast<int>(3 * i);
            const double x = column_or_nan(stmt.get(), base);
            const double y = column_or_nan(stmt.get(), base + 1);
            const double p = column_or_nan(stmt.get(), base + 2);
            auto& lm = track.landmarks[i];
            lm.x.push_back(x);
            lm.y.push_back(y);
            // A sample with a NULL cell is never usable.
            lm.likelihood.push_back(std::isfinite(x) && std::isfinite(y) && std::isfinite(p) ? p : 0.0);
        }
        ++track.frameCount;
    }
    if (rc != SQLITE_DONE) throw_step_error(db, rc, "track query for trial " + trialId);

    if (track.frameCount == 0) {
        throw TrialNotFound(trialId, "no frames in " + path_);
    }

    drop_untracked_landmarks(track);
    canonicalize_track(track);
    return track;
}

// ---------------------------------------------------------------------------
// SQLiteStore
// ---------------------------------------------------------------------------

SQLiteStore::SQLiteStore(const std::string& path) : conn_(SQLiteConnection::open_read_write(path)) {}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS trials (
            id TEXT PRIMARY KEY,
            task TEXT NOT NULL,
            modulation TEXT,
            strain TEXT,
            frame_rate REAL,
            track_path TEXT
        );

        -- Landmark columns ({name}_x, {name}_y, {name}_likelihood) are added on demand.
        CREATE TABLE IF NOT EXISTS track_frames (
            trial_id TEXT NOT NULL,
            frame INTEGER NOT NULL,
            PRIMARY KEY (trial_id, frame),
            FOREIGN KEY(trial_id) REFERENCES trials(id) ON DELETE CASCADE
        );
    )SQL";

    exec_or_throw(conn_.handle(), schema);
}

void SQLiteStore::save_trial(const Trial& trial, const CoordinateTrack& track) {
    sqlite3* db = conn_.handle();
    for (const auto& lm : track.landmarks) require_identifier(lm.name);

    exec_or_throw(db, "BEGIN TRANSACTION;");
    try {
        {
            auto stmt = prepare_or_throw(db,
                "INSERT INTO trials (id, task, modulation, strain, frame_rate, track_path) "
                "VALUES (?,?,?,?,?,?) "
                "ON CONFLICT(id) DO UPDATE SET "
                "task=excluded.task, modulation=excluded.modulation, strain=excluded.strain, "
                "frame_rate=excluded.frame_rate, track_path=excluded.track_path;");

            sqlite3_bind_text(stmt.get(), 1, trial.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, trial.task.c_str(), -1, SQLITE_TRANSIENT);
            // Untreated trials are stored as NULL, never as a sentinel string.
            if (trial.treatment.isNone()) {
                sqlite3_bind_null(stmt.get(), 3);
            } else {
                sqlite3_bind_text(stmt.get(), 3, trial.treatment.label().c_str(), -1, SQLITE_TRANSIENT);
            }
            sqlite3_bind_text(stmt.get(), 4, trial.strain.c_str(), -1, SQLITE_TRANSIENT);
            const double fps = trial.frameRate.value_or(track.frameRate);
            bind_optional_double(stmt.get(), 5, fps > 0.0 ? fps : std::numeric_limits<double>::quiet_NaN());
            sqlite3_bind_text(stmt.get(), 6, trial.trackRef.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw Error(sqlite3_errmsg(db));
            }
        }

        // Add landmark columns this trial introduces
        {
            const std::vector<std::string> existing = conn_.column_names("track_frames");
            auto has = [&](const std::string& col) {
                return std::find(existing.begin(), existing.end(), col) != existing.end();
            };
            for (const auto& lm : track.landmarks) {
                for (const char* suffix : {"_x", "_y", "_likelihood"}) {
                    const std::string col = lm.name + suffix;
                    if (!has(col)) {
                        exec_or_throw(db, "ALTER TABLE track_frames ADD COLUMN " + quote_identifier(col) + " REAL;");
                    }
                }
            }
        }

        {
            auto stmt = prepare_or_throw(db, "DELETE FROM track_frames WHERE trial_id=?;");
            sqlite3_bind_text(stmt.get(), 1, trial.id.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw Error(sqlite3_errmsg(db));
            }
        }

        // Insert frames
        {
            std::string columns = "trial_id, frame";
            std::string placeholders = "?,?";
            for (const auto& lm : track.landmarks) {
                columns += ", " + quote_identifier(lm.name + "_x") + ", " + quote_identifier(lm.name + "_y") + ", " +
                           quote_identifier(lm.name + "_likelihood");
                placeholders += ",?,?,?";
            }
            auto stmt = prepare_or_throw(db,
                "INSERT INTO track_frames (" + columns + ") VALUES (" + placeholders + ");");

            for (std::size_t f = 0; f < track.frameCount; ++f) {
                sqlite3_bind_text(stmt.get(), 1, trial.id.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(f));
                int idx = 3;
                for (const auto& lm : track.landmarks) {
                    bind_optional_double(stmt.get(), idx++, lm.x[f]);
                    bind_optional_double(stmt.get(), idx++, lm.y[f]);
                    bind_optional_double(stmt.get(), idx++, lm.likelihood[f]);
                }

                if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                    throw Error(sqlite3_errmsg(db));
                }
                sqlite3_reset(stmt.get());
            }
        }

        exec_or_throw(db, "COMMIT;");
    } catch (...) {
        // The failing statement may already have ended the transaction; the
        // original error is the one to report.
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

}  // namespace posescope
