// File: src/core/records.hpp
#pragma once

#include "core/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tether {

/// PlayerAction: One discrete player behavior, as tagged by the scenario layer
///
/// Immutable once recorded. The PatternTracker history owns recorded actions
/// through shared pointers; pattern occurrences reference those same objects.
struct PlayerAction {
    ActionType action_type{ActionType::PARENTING_PRESENT};
    ContextType context{ContextType::PRIVATE};
    /// Emotional valence in [-1, 1]
    float valence{0.0f};
    Timestamp timestamp;
    /// Free-form tags (e.g. "behavior_type", "apology_type" for apologies)
    std::map<std::string, std::string> metadata;

    /// Metadata lookup with fallback
    std::string GetMetadata(const std::string& key, const std::string& fallback = "") const;

    bool IsPositive() const { return valence > 0.0f; }

    std::string ToString() const;
};

using ActionRef = std::shared_ptr<const PlayerAction>;

/// BehaviorPattern: A recurring action signature detected inside a window
struct BehaviorPattern {
    PatternType pattern_type{PatternType::CONSISTENT_PRESENCE};
    /// Occurrences in timestamp order (shared with the tracker history)
    std::vector<ActionRef> occurrences;
    /// Occurrences per day over the detection window
    float frequency{0.0f};
    /// Weight anchored at last_seen, in [0, 1]
    float weight{1.0f};
    Timestamp first_seen;
    Timestamp last_seen;
};

/// EmotionalImpact: How an interaction felt. Never carries dialogue text.
struct EmotionalImpact {
    EmotionType primary_emotion{EmotionType::CALM};
    /// Intensity in [0, 1]
    float intensity{0.0f};
    /// Valence in [-1, 1]
    float valence{0.0f};
    ContextCategory context_category{ContextCategory::SUPPORT};
};

/// EmotionalMemory: Stored emotional impact of one interaction
struct EmotionalMemory {
    /// Opaque identifier of the originating interaction
    std::string interaction_id;
    EmotionalImpact emotional_impact;
    Timestamp timestamp;
    ContextType context{ContextType::PRIVATE};
    /// Recency weight in [0, 1], refreshed from elapsed time on read
    float weight{1.0f};
    std::set<PatternType> associated_patterns;
    /// Set when the interaction marked the player as unreliable
    bool flagged_unreliable{false};
};

/// ApologyRecord: Apology-effectiveness tracking for one behavior type
struct ApologyRecord {
    /// Stored effectiveness in [0.1, 1.0] before the apology-type multiplier
    float effectiveness{1.0f};
    std::optional<Timestamp> last_apology;
    std::optional<Timestamp> last_recurrence;
    std::optional<ApologyType> last_apology_type;
    uint32_t recurrence_count{0};
};

/// ResponseModifiers: Response-shaping parameters for the dialogue layer
struct ResponseModifiers {
    float response_length_multiplier{1.0f};  // [0.3, 1.0]
    float initiation_probability{1.0f};      // [0, 1]
    float cooperation_level{1.0f};           // [0, 1]
    float emotional_vulnerability{0.5f};     // [0, 1]
    float interpretation_bias{0.0f};         // [-1, 1]

    /// True when every field is finite and inside its documented range
    bool IsValid() const;

    std::string ToString() const;
};

/// PersonalityState: Consolidated derived state, recomputed on every action
struct PersonalityState {
    float trust_score{60.0f};
    float resentment_score{10.0f};
    float emotional_safety{50.0f};
    float parenting_unity{70.0f};
    bool is_withdrawn{false};
    WithdrawalLevel withdrawal_severity{WithdrawalLevel::NONE};
    std::vector<PatternType> recent_patterns;
    std::vector<EmotionType> dominant_emotions;

    std::string ToString() const;
};

} // namespace tether
