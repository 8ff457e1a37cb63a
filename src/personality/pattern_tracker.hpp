// File: src/personality/pattern_tracker.hpp
#pragma once

#include "core/records.hpp"
#include "memory/decay_functions.hpp"
#include <map>
#include <string>
#include <vector>

namespace tether {

/// PatternTracker: Detects recurring player behavior inside a sliding window
///
/// Keeps a timestamp-ordered history of recorded actions and groups them by
/// pattern signature. A signature with at least min_occurrences matches in the
/// window forms a BehaviorPattern. Pattern weights:
/// - start at 1.0 when a pattern forms and return to 1.0 on each recurrence
/// - decay by daily_decay_rate per elapsed day without recurrence, computed
///   lazily from (now - last_seen)
/// - are dissolved (reported as 0) once below removal_threshold
/// - are reset to 0 when a negative pattern is broken by break_threshold
///   consecutive opposing (positive) actions
///
/// A broken pattern only re-forms from occurrences recorded after the break.
///
/// Thread-safety: Not thread-safe. External synchronization required.
class PatternTracker {
public:
    /// Configuration for pattern tracking
    struct Config {
        Config() = default;
        /// Detection window
        Timestamp::Duration time_window{std::chrono::hours(24 * 7)};
        /// Minimum matches inside the window to form a pattern
        uint32_t min_occurrences{3};
        /// Fractional weight loss per day without recurrence
        float daily_decay_rate{0.1f};
        /// Consecutive opposing actions that break a negative pattern
        uint32_t break_threshold{5};
        /// Valence above which an action counts as opposing a negative pattern
        float opposing_valence_threshold{0.3f};
        /// Decayed weight below which a pattern is dissolved
        float removal_threshold{0.1f};
        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const {
            return time_window.count() > 0 &&
                   min_occurrences > 0 &&
                   daily_decay_rate >= 0.0f && daily_decay_rate <= 1.0f &&
                   break_threshold > 0 &&
                   removal_threshold >= 0.0f && removal_threshold < 1.0f;
        }
    };

    // ========================================================================
    // Construction
    // ========================================================================

    PatternTracker();
    /// @throws std::invalid_argument if config is invalid
    explicit PatternTracker(const Config& config);
    ~PatternTracker() = default;

    // ========================================================================
    // Recording
    // ========================================================================

    /// Append an action to the history (kept in timestamp order)
    ///
    /// Updates the per-pattern consecutive-opposing counters and breaks any
    /// negative pattern whose counter reaches break_threshold.
    /// @return Shared reference to the stored action
    ActionRef RecordAction(const PlayerAction& action);

    // ========================================================================
    // Detection
    // ========================================================================

    /// Detect patterns inside [now - time_window, now]
    /// @return Patterns that reach min_occurrences; empty when data is insufficient
    std::vector<BehaviorPattern> DetectPatterns(Timestamp now = Timestamp::Now());

    /// Detect patterns inside [now - window, now]
    std::vector<BehaviorPattern> DetectPatterns(Timestamp::Duration window, Timestamp now);

    /// Occurrences of type in the active window divided by window length in days
    float GetPatternFrequency(PatternType type, Timestamp now = Timestamp::Now()) const;

    /// Current decayed weight of a pattern, 0 when absent or dissolved
    float GetPatternWeight(PatternType type, Timestamp now = Timestamp::Now()) const;

    /// Reset a negative pattern's weight to 0 once its consecutive-opposing
    /// counter has reached break_threshold
    /// @return True if the pattern was broken
    bool BreakPattern(PatternType type, Timestamp now = Timestamp::Now());

    /// True while a pattern of this type is live (detected and not dissolved)
    bool HasPattern(PatternType type, Timestamp now = Timestamp::Now()) const;

    /// All live patterns with their decayed weights
    std::vector<BehaviorPattern> GetAllPatterns(Timestamp now = Timestamp::Now()) const;

    /// Stored patterns with weights still anchored at last_seen (for snapshots)
    std::vector<BehaviorPattern> GetStoredPatterns() const;

    /// Matching actions for type inside [now - window, now]
    size_t CountInWindow(PatternType type, Timestamp::Duration window, Timestamp now) const;

    /// Actions inside [now - window, now], oldest first
    std::vector<ActionRef> GetActionsInWindow(Timestamp::Duration window, Timestamp now) const;

    /// Current consecutive-opposing counter for a negative pattern
    uint32_t GetConsecutiveOpposing(PatternType type) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Clear history, patterns, counters and break markers
    void ClearHistory();

    /// Drop history entries older than cutoff (patterns keep their occurrences)
    void ClearHistory(Timestamp cutoff);

    /// Replace all state with previously saved state
    ///
    /// Pattern occurrences are re-linked to the matching history entries
    /// (same timestamp and action type); unmatched occurrences are inserted
    /// into the history.
    void Restore(const std::vector<PlayerAction>& history,
                 const std::vector<BehaviorPattern>& patterns,
                 const std::map<PatternType, Timestamp>& broken_at);

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::vector<ActionRef>& GetHistory() const { return history_; }
    size_t GetHistorySize() const { return history_.size(); }
    const std::map<PatternType, Timestamp>& GetBrokenAt() const { return broken_at_; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    DailyRateDecay decay_;

    // Timestamp-ordered action history
    std::vector<ActionRef> history_;

    // Live patterns; weight is anchored at last_seen
    std::map<PatternType, BehaviorPattern> detected_;

    // Consecutive opposing actions per negative pattern type
    std::map<PatternType, uint32_t> consecutive_opposing_;

    // Time each pattern type was last broken
    std::map<PatternType, Timestamp> broken_at_;

    /// Weight of a stored pattern at time now (0 once dissolved)
    float DecayedWeight(const BehaviorPattern& pattern, Timestamp now) const;

    /// Whether an action counts toward type (respects break markers)
    bool Counts(const ActionRef& action, PatternType type) const;

    /// Insert keeping timestamp order; O(1) when appended in order
    void InsertOrdered(const ActionRef& action);

    /// Window length in days, at least one day
    double WindowDays(Timestamp::Duration window) const;

    void UpdateOpposingCounters(const PlayerAction& action);

    void LogDebug(const std::string& message) const;
};

} // namespace tether
