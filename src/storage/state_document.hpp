// File: src/storage/state_document.hpp
//
// Versioned persistence document for a RelationshipSnapshot
//
// {
//   "version": "1.0",
//   "timestamp": "<ISO-8601>",
//   "trust_score", "resentment_score", "emotional_safety", "parenting_unity",
//   "patterns": [...], "emotional_memories": [...],
//   "apology_effectiveness": { "<behavior_type>": {...} },
//   optional: "action_history", "broken_patterns",
//             "trust_positive_streak", "initiation_streak"
// }
//
// Numbers are written rounded to two decimals. Decoding validates every
// numeric field against its range and requires every top-level field except
// the optional ones.

#pragma once

#include "core/snapshot.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tether {

constexpr const char* kDocumentVersion = "1.0";

// LoadStatus: Outcome of reading a persisted document
enum class LoadStatus : uint8_t {
    OK = 0,
    NOT_FOUND = 1,         // No document in the slot
    IO_FAILURE = 2,        // Storage could not be read
    PARSE_ERROR = 3,       // Malformed JSON, wrong field types, unknown names
    VALIDATION_ERROR = 4,  // Missing fields, wrong version, out-of-range values
};

const char* ToString(LoadStatus status);

/// Decoding outcome; snapshot is set only when status is OK
struct DecodeResult {
    std::optional<RelationshipSnapshot> snapshot;
    LoadStatus status{LoadStatus::OK};
    std::string error;
};

/// Encode a snapshot as a version 1.0 document
nlohmann::json EncodeDocument(const RelationshipSnapshot& snapshot);

/// Decode and validate a document
DecodeResult DecodeDocument(const nlohmann::json& document);

/// Parse text, then decode
DecodeResult DecodeDocumentText(const std::string& text);

} // namespace tether
