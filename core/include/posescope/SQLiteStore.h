#pragma once

#include "posescope/PoseTypes.h"
#include "posescope/TrackSource.h"

#include <sqlite3.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace posescope {

/**
 * SQLiteConnection: owning wrapper around one sqlite3 handle (move-only)
 */
class SQLiteConnection {
  public:
    // Opens an existing database read-only and probes it with a query. Any
    // failure (missing file, not a database, busy past the timeout) raises
    // ConnectionUnavailable.
    static SQLiteConnection open_read_only(const std::string& path, int busyTimeoutMs);

    // Opens or creates a database for writing; raises ConnectionUnavailable.
    static SQLiteConnection open_read_write(const std::string& path);

    ~SQLiteConnection();
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    sqlite3* handle() const { return db_; }

    // Column names of a table in declaration order; empty if the table is absent.
    std::vector<std::string> column_names(const std::string& table) const;

    // Runs a query binding text parameters; every cell is handed over as text
    // (NULL -> nullopt).
    void for_each_row(const std::string& sql,
                      const std::vector<std::string>& params,
                      const std::function<void(const std::vector<std::optional<std::string>>&)>& fn) const;

  private:
    explicit SQLiteConnection(sqlite3* db) : db_(db) {}

    sqlite3* db_{nullptr};
};

/**
 * SQLiteConnectionPool: fixed set of read-only connections
 *
 * acquire() blocks until a connection is free; the Lease hands it back on
 * destruction. All connections are opened up front so an unreachable store
 * is detected at construction.
 */
class SQLiteConnectionPool {
  public:
    SQLiteConnectionPool(const std::string& path, std::size_t size, int busyTimeoutMs);

    SQLiteConnectionPool(const SQLiteConnectionPool&) = delete;
    SQLiteConnectionPool& operator=(const SQLiteConnectionPool&) = delete;

    class Lease {
      public:
        Lease(SQLiteConnectionPool& pool, SQLiteConnection conn) : pool_(&pool), conn_(std::move(conn)) {}
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        SQLiteConnection& operator*() { return *conn_; }
        SQLiteConnection* operator->() { return &*conn_; }

      private:
        SQLiteConnectionPool* pool_;
        std::optional<SQLiteConnection> conn_;
    };

    Lease acquire();
    std::size_t size() const { return size_; }

  private:
    void release(SQLiteConnection conn);

    std::size_t size_;
    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<SQLiteConnection> idle_;
};

/**
 * SQLiteTrackSource: relational adapter
 *
 * Reads table track_frames (trial_id, frame, {landmark}_x, {landmark}_y,
 * {landmark}_likelihood) ordered by frame, and the frame rate from trials.
 * Landmarks whose three columns are NULL for every frame of the trial are
 * treated as not tracked in that trial.
 */
class SQLiteTrackSource : public TrackSource {
  public:
    SQLiteTrackSource(const std::string& path, std::size_t poolSize, int busyTimeoutMs, double defaultFrameRate);

    CoordinateTrack fetch(const TrialId& trialId) const override;
    std::string describe() const override;

  private:
    std::string path_;
    double defaultFrameRate_;
    mutable SQLiteConnectionPool pool_;
};

/**
 * SQLiteStore: writer side of the relational schema (ingestion and tests)
 */
class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();
    // Upserts the trial row and replaces its frames in one transaction.
    void save_trial(const Trial& trial, const CoordinateTrack& track);

  private:
    SQLiteConnection conn_;
};

}  // namespace posescope
