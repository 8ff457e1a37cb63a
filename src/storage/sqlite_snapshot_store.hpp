// File: src/storage/sqlite_snapshot_store.hpp
#pragma once

#include "storage/snapshot_store.hpp"
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace tether {

/// Save slots stored as rows of a SQLite table
///
///   saves(slot TEXT PRIMARY KEY, saved_at INTEGER, document TEXT)
///
/// Writes replace the row for a slot in a single statement, so a slot
/// always holds either the previous or the new document.
class SqliteSnapshotStore : public SnapshotStore {
public:
    struct Config {
        Config() = default;
        /// Path to the SQLite database file (":memory:" for an in-memory database)
        std::string db_path;
        /// Enable Write-Ahead Logging
        bool enable_wal{true};
        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};
    };

    /// @throws std::runtime_error if the database cannot be opened
    explicit SqliteSnapshotStore(const Config& config);
    ~SqliteSnapshotStore() override;

    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    StoreStatus Write(const std::string& slot, const std::string& document) override;
    StoreStatus Read(const std::string& slot, std::string* document) const override;
    StoreStatus Remove(const std::string& slot) override;
    std::vector<std::string> List() const override;
    bool Exists(const std::string& slot) const override;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    bool ExecuteSQL(const std::string& sql);
};

} // namespace tether
