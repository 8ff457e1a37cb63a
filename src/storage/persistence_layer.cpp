// File: src/storage/persistence_layer.cpp
#include "storage/persistence_layer.hpp"
#include <iostream>
#include <stdexcept>

namespace tether {

// ============================================================================
// Construction
// ============================================================================

PersistenceLayer::PersistenceLayer(std::unique_ptr<SnapshotStore> store, const Config& config)
    : store_(std::move(store)),
      config_(config)
{
    if (!store_) {
        throw std::invalid_argument("PersistenceLayer requires a SnapshotStore");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid PersistenceLayer configuration");
    }
    writer_ = std::thread(&PersistenceLayer::WriterLoop, this);
}

PersistenceLayer::~PersistenceLayer() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
}

// ============================================================================
// Save / Load
// ============================================================================

bool PersistenceLayer::Save(const RelationshipSnapshot& snapshot) {
    return Save(snapshot, config_.default_slot);
}

bool PersistenceLayer::Save(const RelationshipSnapshot& snapshot, const std::string& slot) {
    if (!IsValidSlotName(slot)) {
        std::cerr << "[PersistenceLayer] Refusing to save to invalid slot '" << slot << "'" << std::endl;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++failed_save_count_;
        return false;
    }

    auto done = std::make_unique<std::promise<bool>>();
    std::future<bool> result = done->get_future();
    Enqueue(PendingSave{snapshot, slot, std::move(done)});
    return result.get();
}

LoadResult PersistenceLayer::Load() {
    return Load(config_.default_slot);
}

LoadResult PersistenceLayer::Load(const std::string& slot) {
    if (!IsValidSlotName(slot)) {
        return Defaults(LoadStatus::IO_FAILURE, "invalid slot name '" + slot + "'");
    }

    std::string text;
    StoreStatus read = store_->Read(slot, &text);
    if (read == StoreStatus::NOT_FOUND) {
        LogDebug("No save in slot " + slot);
        return Defaults(LoadStatus::NOT_FOUND, "no save in slot '" + slot + "'");
    }
    if (read != StoreStatus::OK) {
        std::cerr << "[PersistenceLayer] Cannot read slot " << slot << ", using defaults" << std::endl;
        return Defaults(LoadStatus::IO_FAILURE, "cannot read slot '" + slot + "'");
    }

    DecodeResult decoded = DecodeDocumentText(text);
    if (decoded.status != LoadStatus::OK || !decoded.snapshot) {
        std::cerr << "[PersistenceLayer] Slot " << slot << " rejected ("
                  << ToString(decoded.status) << "): " << decoded.error
                  << "; using defaults" << std::endl;
        return Defaults(decoded.status, decoded.error);
    }

    LoadResult result;
    result.snapshot = std::move(*decoded.snapshot);
    result.status = LoadStatus::OK;
    LogDebug("Loaded slot " + slot);
    return result;
}

void PersistenceLayer::SaveAsync(RelationshipSnapshot snapshot) {
    SaveAsync(std::move(snapshot), config_.default_slot);
}

void PersistenceLayer::SaveAsync(RelationshipSnapshot snapshot, const std::string& slot) {
    Enqueue(PendingSave{std::move(snapshot), slot, nullptr});
}

void PersistenceLayer::Enqueue(PendingSave pending) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(pending));
    }
    queue_cv_.notify_one();
}

void PersistenceLayer::WaitForPendingSaves() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

void PersistenceLayer::WriterLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // Stopping with nothing left to write
            break;
        }

        PendingSave pending = std::move(queue_.front());
        queue_.pop_front();
        writing_ = true;

        lock.unlock();
        bool saved = WriteSnapshot(pending.snapshot, pending.slot);
        if (pending.done) {
            pending.done->set_value(saved);
        } else if (!saved) {
            std::cerr << "[PersistenceLayer] Asynchronous save to slot " << pending.slot
                      << " dropped" << std::endl;
        }
        lock.lock();

        writing_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

// ============================================================================
// Slots
// ============================================================================

std::vector<std::string> PersistenceLayer::ListSaves() const {
    return store_->List();
}

bool PersistenceLayer::DeleteSave(const std::string& slot) {
    StoreStatus status = store_->Remove(slot);
    if (status == StoreStatus::IO_ERROR) {
        std::cerr << "[PersistenceLayer] Cannot delete slot " << slot << std::endl;
    }
    return status == StoreStatus::OK;
}

bool PersistenceLayer::HasSave(const std::string& slot) const {
    return store_->Exists(slot);
}

// ============================================================================
// Statistics
// ============================================================================

uint64_t PersistenceLayer::GetSaveCount() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return save_count_;
}

uint64_t PersistenceLayer::GetFailedSaveCount() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return failed_save_count_;
}

// ============================================================================
// Helper Methods
// ============================================================================

bool PersistenceLayer::WriteSnapshot(const RelationshipSnapshot& snapshot, const std::string& slot) {
    if (!IsValidSlotName(slot)) {
        std::cerr << "[PersistenceLayer] Refusing to save to invalid slot '" << slot << "'" << std::endl;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++failed_save_count_;
        return false;
    }

    // Metadata strings come from the scenario layer and may not be valid UTF-8
    std::string document = EncodeDocument(snapshot).dump(
        config_.pretty_print ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);

    for (uint32_t attempt = 1; attempt <= config_.save_attempts; ++attempt) {
        if (store_->Write(slot, document) == StoreStatus::OK) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++save_count_;
            LogDebug("Saved slot " + slot + " (" + std::to_string(document.size()) + " bytes)");
            return true;
        }
        std::cerr << "[PersistenceLayer] Save to slot " << slot << " failed (attempt "
                  << attempt << " of " << config_.save_attempts << ")" << std::endl;
    }

    std::cerr << "[PersistenceLayer] Giving up on slot " << slot
              << "; continuing without persisting" << std::endl;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++failed_save_count_;
    return false;
}

LoadResult PersistenceLayer::Defaults(LoadStatus status, std::string error) {
    LoadResult result;
    result.snapshot = RelationshipSnapshot::Defaults();
    result.snapshot.timestamp = Timestamp::Now();
    result.status = status;
    result.error = std::move(error);
    return result;
}

void PersistenceLayer::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[PersistenceLayer] " << message << std::endl;
    }
}

} // namespace tether
