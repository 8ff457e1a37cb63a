// File: src/trust/trust_dynamics_engine.hpp
//
// Trust Dynamics Engine - Asymmetric trust and sticky resentment
//
// Trust update pipeline (each step multiplies the running delta):
//   1. Base rate:   valence × 2.0 (positive) or valence × 4.0 (negative)
//   2. Context:     × 2.0 in PUBLIC context (private corrections exempt)
//   3. Diminishing: repeat positive actions of one kind within 1 hour are
//                   capped at 50% of the first action's impact
//   4. Resilience:  negative deltas × 0.7 while trust > 70
//   5. Dampening:   positive deltas × 0.5 while resentment > 50
//   6. Round to 2 decimals, clamp trust into [0, 100]
//
// Resentment grows 3.0 × severity for pattern-confirmed behavior and
// 0.5 × severity for isolated incidents. It decays 0.5 per day, and only
// while a streak of positive trust updates is running.

#pragma once

#include "core/records.hpp"
#include <map>
#include <optional>
#include <string>

namespace tether {

/// TrustDynamicsEngine: Owns trust, resentment and apology effectiveness
///
/// Thread-safety: Not thread-safe. External synchronization required.
class TrustDynamicsEngine {
public:
    /// Configuration for trust dynamics
    struct Config {
        Config() = default;

        float initial_trust{60.0f};
        float initial_resentment{10.0f};

        /// Trust units per unit of positive valence
        float positive_rate{2.0f};
        /// Trust units per unit of negative valence
        float negative_rate{4.0f};
        /// Multiplier for PUBLIC context
        float public_multiplier{2.0f};

        /// Window for diminishing returns on repeated positive actions
        Timestamp::Duration diminishing_window{std::chrono::hours(1)};
        /// Cap for repeats, as a fraction of the first impact in the window
        float diminishing_cap{0.5f};

        /// Trust above which negative deltas are attenuated
        float resilience_threshold{70.0f};
        float resilience_factor{0.7f};

        /// Resentment above which positive deltas are dampened
        float dampening_threshold{50.0f};
        float dampening_factor{0.5f};

        /// Resentment per unit severity
        float pattern_resentment_rate{3.0f};
        float isolated_resentment_rate{0.5f};
        /// Resentment lost per day of sustained positive interaction
        float resentment_daily_decay{0.5f};
        /// Consecutive positive trust updates needed before decay applies
        uint32_t decay_streak_required{3};

        /// Trust below which withdrawal begins
        float withdrawal_threshold{50.0f};
        /// Trust at or above which withdrawal ends (equal to threshold: no hysteresis)
        float withdrawal_exit_threshold{50.0f};
        float mild_floor{40.0f};
        float moderate_floor{30.0f};

        /// Effectiveness lost per recurrence after an apology
        float apology_recurrence_penalty{0.2f};
        float apology_floor{0.1f};
        /// Effectiveness regained per full week without recurrence
        float apology_weekly_recovery{0.1f};

        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const;
    };

    TrustDynamicsEngine();
    /// @throws std::invalid_argument if config is invalid
    explicit TrustDynamicsEngine(const Config& config);
    ~TrustDynamicsEngine() = default;

    // ========================================================================
    // Trust
    // ========================================================================

    /// Trust delta the pipeline would produce, without mutating state
    ///
    /// @param valence Action valence in [-1, 1]
    /// @param context PUBLIC or PRIVATE
    /// @param kind Action kind (diminishing returns and the correction exemption)
    /// @param scale Caller-side multiplier applied after the context step
    /// @param now Time of the action
    float ComputeTrustDelta(float valence,
                            ContextType context,
                            ActionType kind,
                            float scale,
                            Timestamp now) const;

    /// Apply one trust update
    /// @return Applied change in trust, or nullopt when the update was
    ///         non-finite and discarded
    std::optional<float> UpdateTrust(float valence,
                                     ContextType context,
                                     ActionType kind,
                                     float scale = 1.0f,
                                     Timestamp now = Timestamp::Now());

    /// Add a fixed amount of trust (apology repair, explicit adjustments)
    /// @return Applied change, or nullopt if non-finite
    std::optional<float> AdjustTrust(float amount);

    float GetTrust() const { return trust_; }

    // ========================================================================
    // Resentment
    // ========================================================================

    /// Positive delta is a severity scaled by the pattern/isolated rate;
    /// negative delta reduces resentment directly
    /// @return Applied change, or nullopt if non-finite
    std::optional<float> UpdateResentment(float delta, bool is_pattern);

    /// Decay resentment for elapsed days, only while the positive streak holds
    /// @return Amount of resentment removed
    float ApplyResentmentDecay(double days);

    float GetResentment() const { return resentment_; }
    uint32_t GetPositiveStreak() const { return positive_streak_; }

    // ========================================================================
    // Withdrawal
    // ========================================================================

    bool IsInWithdrawal() const { return withdrawn_; }
    WithdrawalLevel GetWithdrawalLevel() const;

    // ========================================================================
    // Apologies
    // ========================================================================

    /// Record an apology for behavior_type
    /// @return Applied effectiveness (stored effectiveness × type multiplier)
    float RecordApology(const std::string& behavior_type,
                        ApologyType apology_type,
                        Timestamp now = Timestamp::Now());

    /// Record a recurrence of behavior_type; penalizes effectiveness when an
    /// apology for it was made earlier
    void RecordBehaviorRecurrence(const std::string& behavior_type,
                                  Timestamp now = Timestamp::Now());

    /// Effectiveness an apology of this type would have now
    float GetApologyEffectiveness(const std::string& behavior_type,
                                  ApologyType apology_type,
                                  Timestamp now = Timestamp::Now()) const;

    /// Stored effectiveness including weekly recovery
    float GetStoredEffectiveness(const std::string& behavior_type,
                                 Timestamp now = Timestamp::Now()) const;

    const std::map<std::string, ApologyRecord>& GetApologyRecords() const { return apologies_; }

    static float ApologyTypeMultiplier(ApologyType type);

    // ========================================================================
    // State
    // ========================================================================

    /// Replace state with saved values (clamped and rounded)
    void Restore(float trust,
                 float resentment,
                 const std::map<std::string, ApologyRecord>& apologies,
                 uint32_t positive_streak = 0);

    /// Back to configured initial values
    void Reset();

    const Config& GetConfig() const { return config_; }

private:
    /// First positive impact per action kind inside the diminishing window
    struct ImpactWindow {
        Timestamp start;
        float first_impact{0.0f};
    };

    Config config_;

    float trust_;
    float resentment_;
    bool withdrawn_{false};
    uint32_t positive_streak_{0};

    std::map<ActionType, ImpactWindow> impact_windows_;
    std::map<std::string, ApologyRecord> apologies_;

    /// Effectiveness after weekly recovery since the last recurrence
    float RecoveredEffectiveness(const ApologyRecord& record, Timestamp now) const;

    void UpdateWithdrawal();

    void LogDebug(const std::string& message) const;
};

} // namespace tether
