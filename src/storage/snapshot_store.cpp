// File: src/storage/snapshot_store.cpp
#include "storage/snapshot_store.hpp"
#include <cctype>

namespace tether {

bool IsValidSlotName(const std::string& slot) {
    if (slot.empty() || slot.size() > 64) {
        return false;
    }
    for (char c : slot) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

} // namespace tether
