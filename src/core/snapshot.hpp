// File: src/core/snapshot.hpp
#pragma once

#include "core/records.hpp"
#include <map>
#include <string>
#include <vector>

namespace tether {

/// RelationshipSnapshot: Source-of-truth state of one relationship
///
/// Produced by PersonalityStateManager::CreateSnapshot and consumed by the
/// persistence layer. PersonalityState and ResponseModifiers are derived from
/// this and never stored.
struct RelationshipSnapshot {
    Timestamp timestamp;

    float trust_score{60.0f};
    float resentment_score{10.0f};
    float emotional_safety{50.0f};
    float parenting_unity{70.0f};

    /// Stored patterns (weights anchored at last_seen)
    std::vector<BehaviorPattern> patterns;
    std::vector<EmotionalMemory> emotional_memories;
    /// Keyed by behavior type
    std::map<std::string, ApologyRecord> apology_effectiveness;

    // Optional extras; absent from older documents
    std::vector<PlayerAction> action_history;
    std::map<PatternType, Timestamp> broken_patterns;
    uint32_t trust_positive_streak{0};
    uint32_t initiation_streak{0};

    /// Documented default state (trust 60, resentment 10, safety 50, unity 70)
    static RelationshipSnapshot Defaults() { return RelationshipSnapshot(); }
};

} // namespace tether
