// File: src/storage/file_snapshot_store.cpp
#include "storage/file_snapshot_store.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace tether {

namespace {

constexpr const char* kExtension = ".json";

} // namespace

FileSnapshotStore::FileSnapshotStore(std::string directory)
    : directory_(std::move(directory))
{
}

std::string FileSnapshotStore::PathFor(const std::string& slot) const {
    return (fs::path(directory_) / (slot + kExtension)).string();
}

StoreStatus FileSnapshotStore::Write(const std::string& slot, const std::string& document) {
    if (!IsValidSlotName(slot)) {
        std::cerr << "[FileSnapshotStore] Invalid slot name '" << slot << "'" << std::endl;
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "[FileSnapshotStore] Cannot create " << directory_
                  << ": " << ec.message() << std::endl;
        return StoreStatus::IO_ERROR;
    }

    std::string path = PathFor(slot);
    std::string temp_path = path + ".tmp";

    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FileSnapshotStore] Cannot open " << temp_path << " for writing" << std::endl;
            return StoreStatus::IO_ERROR;
        }
        out << document;
        out.flush();
        if (!out.good()) {
            std::cerr << "[FileSnapshotStore] Write to " << temp_path << " failed" << std::endl;
            return StoreStatus::IO_ERROR;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::cerr << "[FileSnapshotStore] Cannot move " << temp_path << " into place: "
                  << ec.message() << std::endl;
        fs::remove(temp_path, ec);
        return StoreStatus::IO_ERROR;
    }

    return StoreStatus::OK;
}

StoreStatus FileSnapshotStore::Read(const std::string& slot, std::string* document) const {
    if (!IsValidSlotName(slot)) {
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = PathFor(slot);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ec ? StoreStatus::IO_ERROR : StoreStatus::NOT_FOUND;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[FileSnapshotStore] Cannot open " << path << " for reading" << std::endl;
        return StoreStatus::IO_ERROR;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return StoreStatus::IO_ERROR;
    }

    *document = buffer.str();
    return StoreStatus::OK;
}

StoreStatus FileSnapshotStore::Remove(const std::string& slot) {
    if (!IsValidSlotName(slot)) {
        return StoreStatus::IO_ERROR;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool removed = fs::remove(PathFor(slot), ec);
    if (ec) {
        std::cerr << "[FileSnapshotStore] Cannot remove slot " << slot << ": " << ec.message() << std::endl;
        return StoreStatus::IO_ERROR;
    }
    return removed ? StoreStatus::OK : StoreStatus::NOT_FOUND;
}

std::vector<std::string> FileSnapshotStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> slots;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return slots;
    }

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const fs::path& path = entry.path();
        if (path.extension() == kExtension && IsValidSlotName(path.stem().string())) {
            slots.push_back(path.stem().string());
        }
    }

    std::sort(slots.begin(), slots.end());
    return slots;
}

bool FileSnapshotStore::Exists(const std::string& slot) const {
    if (!IsValidSlotName(slot)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::exists(PathFor(slot), ec);
}

} // namespace tether
