// File: src/personality/personality_state_manager.hpp
//
// Personality State Manager - Coordinator for one relationship
//
// Routes each PlayerAction through the PatternTracker, the TrustDynamicsEngine
// and the EmotionalMemorySystem, then recomputes the derived PersonalityState
// and ResponseModifiers. Secondary metrics tracked here:
//   - emotional safety (stress acknowledgment vs. dismissal)
//   - parenting unity (PUBLIC support vs. contradiction only)
//   - conflict engagement vs. avoidance
//   - parenting consistency (variation of daily involvement)
//   - control taking (reduces cooperation)
//   - initiation response streaks (raises initiation probability)
//
// Actions are applied strictly in timestamp order. All mutation goes through
// an exclusive lock; reads take a shared lock.

#pragma once

#include "core/snapshot.hpp"
#include "memory/emotional_memory.hpp"
#include "personality/modifier_presets.hpp"
#include "personality/pattern_tracker.hpp"
#include "trust/trust_dynamics_engine.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tether {

// ProcessStatus: Outcome of applying one action
enum class ProcessStatus : uint8_t {
    APPLIED = 0,
    DISCARDED_NON_FINITE = 1,  // Non-finite input or result; prior state kept
    REORDERED = 2,             // Stale timestamp, applied at the last processed time
};

const char* ToString(ProcessStatus status);

/// PersonalityStateManager: Owns all relationship subsystems
///
/// Thread-safety: ProcessAction/ProcessBatch/RestoreSnapshot/Reset are
/// serialized; GetCurrentState/GetResponseModifiers/CreateSnapshot may run
/// concurrently with each other. Subsystem accessors are not synchronized.
class PersonalityStateManager {
public:
    /// Configuration for the coordinator and its subsystems
    struct Config {
        Config() = default;

        PatternTracker::Config patterns;
        EmotionalMemorySystem::Config memory;
        TrustDynamicsEngine::Config trust;

        float initial_emotional_safety{50.0f};
        float initial_parenting_unity{70.0f};

        /// Safety gained per unit valence of stress acknowledgment
        float acknowledgment_rate{3.0f};
        /// Safety lost per unit valence of stress dismissal
        float dismissal_rate{1.0f};
        /// Safety above which other stressors are attenuated
        float safety_buffer_threshold{70.0f};
        float safety_buffer_factor{0.7f};

        /// Unity change per unit valence of a PUBLIC parenting action
        float unity_rate{5.0f};

        /// Resentment relief per unit valence of conflict engagement
        float engagement_relief{1.0f};
        /// Resentment relief per unit valence of isolated conflict avoidance
        float avoidance_relief{0.25f};

        /// Window for conflict, control and parenting sub-tracking
        Timestamp::Duration sub_pattern_window{std::chrono::hours(24 * 7)};
        /// Instances in the window that make avoidance or control a pattern
        uint32_t sub_pattern_threshold{3};

        /// Trust multiplier for pattern-confirmed negative behavior
        float pattern_trust_multiplier{1.5f};

        /// Cooperation loss per unit of control-taking frequency (actions/day)
        float cooperation_penalty_rate{0.35f};
        float max_cooperation_penalty{0.6f};

        float initiation_baseline{0.8f};
        float initiation_minimum{0.1f};
        float initiation_boost{0.15f};
        uint32_t initiation_streak_required{3};

        /// Largest per-interaction rise of length, initiation and cooperation
        /// while recovering from withdrawal
        float recovery_step{0.15f};

        /// Trust restored per unit of applied apology effectiveness
        float apology_trust_repair{5.0f};
        /// Resentment relieved per unit of applied apology effectiveness
        float apology_resentment_relief{1.0f};

        size_t dominant_emotion_count{3};

        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const;
    };

    PersonalityStateManager();
    /// @throws std::invalid_argument if any configuration is invalid
    explicit PersonalityStateManager(const Config& config);
    ~PersonalityStateManager() = default;

    PersonalityStateManager(const PersonalityStateManager&) = delete;
    PersonalityStateManager& operator=(const PersonalityStateManager&) = delete;

    // ========================================================================
    // Processing
    // ========================================================================

    /// Apply one action
    ProcessStatus ProcessAction(const PlayerAction& action);

    /// Sort by timestamp, then apply each action in order
    /// @return One status per action, in processing order
    std::vector<ProcessStatus> ProcessBatch(std::vector<PlayerAction> actions);

    // ========================================================================
    // Queries
    // ========================================================================

    PersonalityState GetCurrentState() const;
    ResponseModifiers GetResponseModifiers() const;

    /// 1 - coefficient of variation of daily PARENTING_PRESENT counts over
    /// the sub-pattern window; 1.0 with too little data
    float GetParentingConsistency(Timestamp now = Timestamp::Now()) const;

    /// Timestamp of the last applied action
    std::optional<Timestamp> GetLastProcessed() const;

    // ========================================================================
    // Snapshot
    // ========================================================================

    RelationshipSnapshot CreateSnapshot(Timestamp now = Timestamp::Now()) const;

    /// Replace all state; derived state is recomputed without ramping
    void RestoreSnapshot(const RelationshipSnapshot& snapshot);

    /// Return to the documented defaults
    void Reset();

    // ========================================================================
    // Subsystem access (not synchronized)
    // ========================================================================

    const PatternTracker& GetPatternTracker() const { return tracker_; }
    const EmotionalMemorySystem& GetMemorySystem() const { return memory_; }
    const TrustDynamicsEngine& GetTrustEngine() const { return trust_; }
    const Config& GetConfig() const { return config_; }

private:
    /// Scalar state captured before an update so it can be rolled back
    struct Checkpoint {
        TrustDynamicsEngine trust;
        float emotional_safety;
        float parenting_unity;
        uint32_t initiation_streak;
        ResponseModifiers modifiers;
        bool recovering;
    };

    Config config_;

    PatternTracker tracker_;
    EmotionalMemorySystem memory_;
    TrustDynamicsEngine trust_;

    float emotional_safety_;
    float parenting_unity_;
    uint32_t initiation_streak_{0};
    uint64_t interaction_counter_{0};
    std::optional<Timestamp> last_processed_;

    PersonalityState state_;
    ResponseModifiers modifiers_;
    bool recovering_{false};

    mutable std::shared_mutex mutex_;

    ProcessStatus ProcessLocked(PlayerAction action);

    /// Trust, resentment and apology effects of one action
    /// @return False if an update was non-finite
    bool ApplyTrustEffects(const PlayerAction& action, bool pattern_confirmed);

    /// Safety, unity, conflict and initiation effects of one action
    /// @param unreliable Set when the player should be flagged unreliable
    /// @return False if an update was non-finite
    bool ApplySecondaryEffects(const PlayerAction& action, bool* unreliable);

    void StoreInteraction(const PlayerAction& action, bool pattern_confirmed, bool unreliable);

    /// Recompute state_ and modifiers_; ramp rises while recovering
    void RecomputeDerived(Timestamp now, bool ramp);

    ResponseModifiers ComputeTargetModifiers(Timestamp now) const;

    float ParentingConsistencyLocked(Timestamp now) const;

    bool StateIsFinite() const;

    /// History older than the longest window no query reaches
    Timestamp::Duration HistoryRetention() const;

    Checkpoint MakeCheckpoint() const;
    void RestoreCheckpoint(const Checkpoint& checkpoint);

    void LogDebug(const std::string& message) const;
};

} // namespace tether
