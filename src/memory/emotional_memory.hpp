// File: src/memory/emotional_memory.hpp
//
// Emotional Memory - Recency-weighted store of how interactions felt
//
// Each stored interaction keeps only its EmotionalImpact (emotion, intensity,
// valence, category) plus context and pattern tags. Weights follow the
// freshness table:
//
//   age < 24h        → 1.0
//   1 day – 7 days   → 0.8
//   7 days – 30 days → 0.5
//   > 30 days        → 0.3
//
// Weights are computed live from (now - timestamp) on every read. When the
// store grows past max_memories, the lowest-weight (then oldest) entries are
// evicted; entries weighted above protected_weight are never evicted.

#pragma once

#include "core/records.hpp"
#include "memory/decay_functions.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tether {

/// Identifying summary of one interaction (no dialogue text)
struct InteractionSummary {
    std::string interaction_id;
    ContextType context{ContextType::PRIVATE};
    Timestamp timestamp;
    std::set<PatternType> associated_patterns;
    bool flagged_unreliable{false};
};

/// EmotionalMemorySystem: Stores, decays, prunes and recalls emotional memories
///
/// Thread-safety: Not thread-safe. External synchronization required.
class EmotionalMemorySystem {
public:
    /// Configuration for the memory store
    struct Config {
        Config() = default;
        /// Hard cap on stored memories
        size_t max_memories{1000};
        /// Memories weighted above this are never evicted
        float protected_weight{0.8f};
        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const {
            return max_memories > 0 &&
                   protected_weight >= 0.0f && protected_weight <= 1.0f;
        }
    };

    /// Store statistics
    struct Stats {
        size_t total_memories{0};
        size_t unreliable_memories{0};
        size_t total_pruned{0};
        float average_valence{0.0f};
        std::map<EmotionType, size_t> emotion_counts;
        std::map<ContextCategory, size_t> category_counts;
    };

    EmotionalMemorySystem();
    /// @throws std::invalid_argument if config is invalid
    explicit EmotionalMemorySystem(const Config& config);
    ~EmotionalMemorySystem() = default;

    // ========================================================================
    // Storage
    // ========================================================================

    /// Create a memory seeded at weight 1.0, then prune to capacity
    /// @return The stored memory
    EmotionalMemory StoreMemory(const InteractionSummary& summary,
                                const EmotionalImpact& impact,
                                Timestamp now = Timestamp::Now());

    // ========================================================================
    // Recall
    // ========================================================================

    /// Up to limit memories in the given context (and category, if given),
    /// heaviest first; ties go to the newer memory
    std::vector<EmotionalMemory> RecallSimilar(
        ContextType context,
        size_t limit,
        Timestamp now = Timestamp::Now(),
        std::optional<ContextCategory> category = std::nullopt) const;

    /// Weighted mean valence of all memories in a category; 0 when none
    float GetEmotionalAssociation(ContextCategory category,
                                  Timestamp now = Timestamp::Now()) const;

    /// Memories younger than hours, newest first
    std::vector<EmotionalMemory> GetRecentMemories(double hours,
                                                   size_t limit,
                                                   Timestamp now = Timestamp::Now()) const;

    std::vector<EmotionalMemory> GetMemoriesByEmotion(EmotionType emotion,
                                                      Timestamp now = Timestamp::Now()) const;

    std::vector<EmotionalMemory> GetMemoriesByPattern(PatternType pattern,
                                                      Timestamp now = Timestamp::Now()) const;

    /// Unweighted mean valence over the last days, optionally per category
    float GetAverageValence(std::optional<ContextCategory> category,
                            double days,
                            Timestamp now = Timestamp::Now()) const;

    /// Emotions ranked by summed intensity × weight
    std::vector<EmotionType> GetDominantEmotions(size_t limit,
                                                 Timestamp now = Timestamp::Now()) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Refresh every stored weight from elapsed time (idempotent)
    /// @return Number of memories whose weight changed
    size_t ApplyTemporalDecay(Timestamp now = Timestamp::Now());

    /// Remove memories older than days
    /// @return Number removed
    size_t ClearOldMemories(double days, Timestamp now = Timestamp::Now());

    /// True if any stored memory flags the player as unreliable
    bool HasUnreliableFlag() const;

    /// Replace all memories (timestamps keep their original values)
    void Restore(const std::vector<EmotionalMemory>& memories);

    void Clear();

    // ========================================================================
    // Accessors
    // ========================================================================

    Stats GetStats() const;
    size_t GetMemoryCount() const { return memories_.size(); }
    const std::vector<EmotionalMemory>& GetMemories() const { return memories_; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    FreshnessTableDecay decay_;

    // Memories in timestamp order
    std::vector<EmotionalMemory> memories_;

    size_t total_pruned_{0};

    /// Weight of a memory at time now
    float LiveWeight(const EmotionalMemory& memory, Timestamp now) const;

    /// Copy of a memory carrying its live weight
    EmotionalMemory WithLiveWeight(const EmotionalMemory& memory, Timestamp now) const;

    /// Evict until within max_memories
    /// @return Number removed
    size_t PruneToCapacity(Timestamp now);

    void LogDebug(const std::string& message) const;
};

} // namespace tether
