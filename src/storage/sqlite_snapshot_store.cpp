// File: src/storage/sqlite_snapshot_store.cpp
#include "storage/sqlite_snapshot_store.hpp"
#include "core/types.hpp"
#include <iostream>
#include <stdexcept>

namespace tether {

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteSnapshotStore::SqliteSnapshotStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    InitializeDatabase();
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
    if (db_) {
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            std::cerr << "[SqliteSnapshotStore] Close failed: " << sqlite3_errstr(rc) << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteSnapshotStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS saves (
            slot TEXT PRIMARY KEY,
            saved_at INTEGER NOT NULL,
            document TEXT NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create saves table");
    }
}

bool SqliteSnapshotStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "[SqliteSnapshotStore] " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// SnapshotStore Interface
// ============================================================================

StoreStatus SqliteSnapshotStore::Write(const std::string& slot, const std::string& document) {
    if (!IsValidSlotName(slot)) {
        std::cerr << "[SqliteSnapshotStore] Invalid slot name '" << slot << "'" << std::endl;
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "INSERT OR REPLACE INTO saves (slot, saved_at, document) VALUES (?, ?, ?);";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "[SqliteSnapshotStore] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        return StoreStatus::IO_ERROR;
    }

    sqlite3_bind_text(stmt, 1, slot.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, Timestamp::Now().ToMicros());
    sqlite3_bind_text(stmt, 3, document.c_str(), static_cast<int>(document.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::cerr << "[SqliteSnapshotStore] Write failed: " << sqlite3_errmsg(db_) << std::endl;
        return StoreStatus::IO_ERROR;
    }
    return StoreStatus::OK;
}

StoreStatus SqliteSnapshotStore::Read(const std::string& slot, std::string* document) const {
    if (!IsValidSlotName(slot)) {
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT document FROM saves WHERE slot = ?;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return StoreStatus::IO_ERROR;
    }

    sqlite3_bind_text(stmt, 1, slot.c_str(), -1, SQLITE_TRANSIENT);

    StoreStatus status;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        int size = sqlite3_column_bytes(stmt, 0);
        document->assign(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
        status = StoreStatus::OK;
    } else if (rc == SQLITE_DONE) {
        status = StoreStatus::NOT_FOUND;
    } else {
        status = StoreStatus::IO_ERROR;
    }

    sqlite3_finalize(stmt);
    return status;
}

StoreStatus SqliteSnapshotStore::Remove(const std::string& slot) {
    if (!IsValidSlotName(slot)) {
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "DELETE FROM saves WHERE slot = ?;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return StoreStatus::IO_ERROR;
    }

    sqlite3_bind_text(stmt, 1, slot.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return StoreStatus::IO_ERROR;
    }
    return sqlite3_changes(db_) > 0 ? StoreStatus::OK : StoreStatus::NOT_FOUND;
}

std::vector<std::string> SqliteSnapshotStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> slots;
    const char* sql = "SELECT slot FROM saves ORDER BY slot;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return slots;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        slots.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return slots;
}

bool SqliteSnapshotStore::Exists(const std::string& slot) const {
    if (!IsValidSlotName(slot)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT 1 FROM saves WHERE slot = ? LIMIT 1;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, slot.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return exists;
}

} // namespace tether
