// File: src/storage/file_snapshot_store.hpp
#pragma once

#include "storage/snapshot_store.hpp"
#include <mutex>
#include <string>

namespace tether {

/// Save slots as JSON files: <directory>/<slot>.json
///
/// Writes go to <slot>.json.tmp first and are renamed into place, so a
/// failed write never truncates an existing save.
class FileSnapshotStore : public SnapshotStore {
public:
    /// @param directory Created on first write if missing
    explicit FileSnapshotStore(std::string directory);
    ~FileSnapshotStore() override = default;

    StoreStatus Write(const std::string& slot, const std::string& document) override;
    StoreStatus Read(const std::string& slot, std::string* document) const override;
    StoreStatus Remove(const std::string& slot) override;
    std::vector<std::string> List() const override;
    bool Exists(const std::string& slot) const override;

    const std::string& GetDirectory() const { return directory_; }

    /// Full path for a slot
    std::string PathFor(const std::string& slot) const;

private:
    std::string directory_;
    mutable std::mutex mutex_;
};

} // namespace tether
