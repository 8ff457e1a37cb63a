// File: src/storage/persistence_layer.hpp
//
// Persistence Layer - Versioned save/load of relationship snapshots
//
// Save: encode → write to the slot; one retry on failure, then log and
//       continue without persisting.
// Load: read → parse → validate; on any failure the documented defaults
//       (trust 60, resentment 10, safety 50, unity 70) come back together
//       with a LoadStatus and an error message for the caller to log.
//
// Every write goes through a single writer thread: SaveAsync queues and
// returns, Save queues and waits for its own result. Saves are written in
// submission order whichever entry point queued them. Strings that are not
// valid UTF-8 are written with U+FFFD replacement characters.

#pragma once

#include "core/snapshot.hpp"
#include "storage/snapshot_store.hpp"
#include "storage/state_document.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tether {

/// Result of a load; snapshot holds defaults unless status is OK
struct LoadResult {
    RelationshipSnapshot snapshot;
    LoadStatus status{LoadStatus::OK};
    std::string error;

    bool ok() const { return status == LoadStatus::OK; }
};

/// PersistenceLayer: Saves and restores snapshots through a SnapshotStore
///
/// Thread-safety: All methods are thread-safe.
class PersistenceLayer {
public:
    struct Config {
        Config() {}
        /// Slot used when none is given
        std::string default_slot{"autosave"};
        /// Write attempts per save (first try plus retries)
        uint32_t save_attempts{2};
        /// Indent JSON documents
        bool pretty_print{true};
        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const {
            return IsValidSlotName(default_slot) && save_attempts > 0;
        }
    };

    /// @throws std::invalid_argument if store is null or config is invalid
    explicit PersistenceLayer(std::unique_ptr<SnapshotStore> store,
                              const Config& config = Config());

    /// Finishes pending asynchronous saves before returning
    ~PersistenceLayer();

    PersistenceLayer(const PersistenceLayer&) = delete;
    PersistenceLayer& operator=(const PersistenceLayer&) = delete;

    // ========================================================================
    // Save / Load
    // ========================================================================

    /// Write after every save queued before it
    /// @return True if the snapshot was written
    bool Save(const RelationshipSnapshot& snapshot);
    bool Save(const RelationshipSnapshot& snapshot, const std::string& slot);

    LoadResult Load();
    LoadResult Load(const std::string& slot);

    /// Queue a save on the writer thread and return immediately
    void SaveAsync(RelationshipSnapshot snapshot);
    void SaveAsync(RelationshipSnapshot snapshot, const std::string& slot);

    /// Block until every queued asynchronous save has been attempted
    void WaitForPendingSaves();

    // ========================================================================
    // Slots
    // ========================================================================

    std::vector<std::string> ListSaves() const;

    /// @return True if the slot existed and was removed
    bool DeleteSave(const std::string& slot);

    bool HasSave(const std::string& slot) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t GetSaveCount() const;
    uint64_t GetFailedSaveCount() const;
    const Config& GetConfig() const { return config_; }

private:
    struct PendingSave {
        RelationshipSnapshot snapshot;
        std::string slot;
        /// Set by the writer for a synchronous Save, null for SaveAsync
        std::unique_ptr<std::promise<bool>> done;
    };

    std::unique_ptr<SnapshotStore> store_;
    Config config_;

    mutable std::mutex stats_mutex_;
    uint64_t save_count_{0};
    uint64_t failed_save_count_{0};

    // Writer thread state
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<PendingSave> queue_;
    bool writing_{false};
    bool stopping_{false};
    std::thread writer_;

    void WriterLoop();
    void Enqueue(PendingSave pending);

    /// Encode and write with retries; runs on the writer thread
    bool WriteSnapshot(const RelationshipSnapshot& snapshot, const std::string& slot);

    static LoadResult Defaults(LoadStatus status, std::string error);

    void LogDebug(const std::string& message) const;
};

} // namespace tether
