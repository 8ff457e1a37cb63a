// File: src/storage/snapshot_store.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tether {

// StoreStatus: Outcome of a raw store operation
enum class StoreStatus : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    IO_ERROR = 2,
};

/// Abstract interface for save-slot storage of serialized documents
///
/// Stores deal only in document text; encoding and validation live in the
/// persistence layer. Implementations must be safe to call from the
/// persistence writer thread and the caller's thread concurrently.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /// Create or replace the document in slot
    virtual StoreStatus Write(const std::string& slot, const std::string& document) = 0;

    /// Read the document in slot into *document
    virtual StoreStatus Read(const std::string& slot, std::string* document) const = 0;

    /// Remove slot; NOT_FOUND if it does not exist
    virtual StoreStatus Remove(const std::string& slot) = 0;

    /// Slot names, sorted
    virtual std::vector<std::string> List() const = 0;

    virtual bool Exists(const std::string& slot) const = 0;
};

/// Slot names are 1-64 characters of [A-Za-z0-9_-]
bool IsValidSlotName(const std::string& slot);

} // namespace tether
