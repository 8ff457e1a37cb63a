// File: src/personality/personality_state_manager.cpp
//
// Implementation of PersonalityStateManager

#include "personality/personality_state_manager.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace tether {

namespace {

constexpr auto kOneDay = std::chrono::hours(24);

bool IsDismissal(ActionType type) {
    return type == ActionType::STRESS_DISMISSED || type == ActionType::EMPATHY_LACKING;
}

double DurationDays(Timestamp::Duration window) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<86400>>>(window).count();
}

EmotionType EmotionFor(ActionType type, float valence, bool pattern_confirmed) {
    if (valence == 0.0f) {
        return EmotionType::CALM;
    }

    if (valence > 0.0f) {
        switch (type) {
            case ActionType::PARENTING_PRESENT:   return EmotionType::JOY;
            case ActionType::PUBLIC_SUPPORT:      return EmotionType::PRIDE;
            case ActionType::EMPATHY_SHOWN:
            case ActionType::STRESS_ACKNOWLEDGED:
            case ActionType::SUPPORTIVE_AUTONOMY: return EmotionType::TRUST;
            case ActionType::INITIATION_RESPONSE: return EmotionType::LOVE;
            case ActionType::APOLOGY:             return EmotionType::CONTENTMENT;
            case ActionType::CONFLICT_ENGAGE:
            case ActionType::PRIVATE_CORRECTION:  return EmotionType::CALM;
            default:                              return EmotionType::CONTENTMENT;
        }
    }

    if (pattern_confirmed) {
        return EmotionType::RESENTMENT;
    }
    switch (type) {
        case ActionType::PARENTING_ABSENT:     return EmotionType::DISAPPOINTMENT;
        case ActionType::CONTROL_TAKING:
        case ActionType::CONFLICT_AVOID:       return EmotionType::FRUSTRATION;
        case ActionType::PUBLIC_CONTRADICTION: return EmotionType::ANGER;
        case ActionType::STRESS_DISMISSED:
        case ActionType::EMPATHY_LACKING:      return EmotionType::SADNESS;
        case ActionType::PRIVATE_CORRECTION:   return EmotionType::ANXIETY;
        default:                               return EmotionType::DISAPPOINTMENT;
    }
}

} // namespace

const char* ToString(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::APPLIED:              return "APPLIED";
        case ProcessStatus::DISCARDED_NON_FINITE: return "DISCARDED_NON_FINITE";
        case ProcessStatus::REORDERED:            return "REORDERED";
    }
    return "UNKNOWN";
}

// ============================================================================
// Config
// ============================================================================

bool PersonalityStateManager::Config::IsValid() const {
    if (!patterns.IsValid() || !memory.IsValid() || !trust.IsValid()) {
        return false;
    }
    if (initial_emotional_safety < 0.0f || initial_emotional_safety > 100.0f ||
        initial_parenting_unity < 0.0f || initial_parenting_unity > 100.0f) {
        return false;
    }
    if (acknowledgment_rate < 0.0f || dismissal_rate < 0.0f || unity_rate < 0.0f) {
        return false;
    }
    if (safety_buffer_factor < 0.0f || safety_buffer_factor > 1.0f) {
        return false;
    }
    if (engagement_relief < 0.0f || avoidance_relief < 0.0f) {
        return false;
    }
    if (sub_pattern_window.count() <= 0 || sub_pattern_threshold == 0) {
        return false;
    }
    if (pattern_trust_multiplier < 1.0f) {
        return false;
    }
    if (cooperation_penalty_rate < 0.0f ||
        max_cooperation_penalty < 0.0f || max_cooperation_penalty > 1.0f) {
        return false;
    }
    if (initiation_minimum < 0.0f || initiation_baseline > 1.0f ||
        initiation_minimum > initiation_baseline || initiation_boost < 0.0f) {
        return false;
    }
    if (recovery_step <= 0.0f || recovery_step > 1.0f) {
        return false;
    }
    if (apology_trust_repair < 0.0f || apology_resentment_relief < 0.0f) {
        return false;
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

PersonalityStateManager::PersonalityStateManager()
    : PersonalityStateManager(Config())
{
}

PersonalityStateManager::PersonalityStateManager(const Config& config)
    : config_(config),
      tracker_(config.patterns),
      memory_(config.memory),
      trust_(config.trust),
      emotional_safety_(config.initial_emotional_safety),
      parenting_unity_(config.initial_parenting_unity)
{
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid PersonalityStateManager configuration");
    }
    RecomputeDerived(Timestamp::Now(), false);
}

// ============================================================================
// Processing
// ============================================================================

ProcessStatus PersonalityStateManager::ProcessAction(const PlayerAction& action) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return ProcessLocked(action);
}

std::vector<ProcessStatus> PersonalityStateManager::ProcessBatch(std::vector<PlayerAction> actions) {
    std::stable_sort(actions.begin(), actions.end(),
                     [](const PlayerAction& a, const PlayerAction& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<ProcessStatus> results;
    results.reserve(actions.size());
    for (auto& action : actions) {
        results.push_back(ProcessLocked(std::move(action)));
    }
    return results;
}

ProcessStatus PersonalityStateManager::ProcessLocked(PlayerAction action) {
    if (!std::isfinite(action.valence)) {
        std::cerr << "[PersonalityStateManager] Discarded " << ToString(action.action_type)
                  << " with non-finite valence" << std::endl;
        return ProcessStatus::DISCARDED_NON_FINITE;
    }
    action.valence = Clamp(action.valence, -1.0f, 1.0f);

    ProcessStatus status = ProcessStatus::APPLIED;
    if (last_processed_ && action.timestamp < *last_processed_) {
        std::cerr << "[PersonalityStateManager] Out-of-order action " << action.ToString()
                  << " applied at " << last_processed_->ToIso8601() << std::endl;
        action.timestamp = *last_processed_;
        status = ProcessStatus::REORDERED;
    }
    const Timestamp now = action.timestamp;

    Checkpoint checkpoint = MakeCheckpoint();
    bool was_withdrawn = trust_.IsInWithdrawal();

    if (last_processed_) {
        trust_.ApplyResentmentDecay(ElapsedDays(*last_processed_, now));
    }

    tracker_.RecordAction(action);
    tracker_.DetectPatterns(now);
    tracker_.ClearHistory(now - HistoryRetention());

    PatternType signature;
    bool pattern_confirmed = PatternForAction(action.action_type, &signature) &&
                             IsNegativePattern(signature) &&
                             tracker_.HasPattern(signature, now);

    bool unreliable = false;
    bool ok = ApplyTrustEffects(action, pattern_confirmed) &&
              ApplySecondaryEffects(action, &unreliable);

    last_processed_ = now;

    if (!ok || !StateIsFinite()) {
        RestoreCheckpoint(checkpoint);
        std::cerr << "[PersonalityStateManager] Discarded non-finite update from "
                  << action.ToString() << std::endl;
        return ProcessStatus::DISCARDED_NON_FINITE;
    }

    StoreInteraction(action, pattern_confirmed, unreliable);

    if (was_withdrawn && !trust_.IsInWithdrawal()) {
        recovering_ = true;
        LogDebug("Recovering from withdrawal");
    }
    RecomputeDerived(now, true);

    LogDebug(action.ToString() + " -> " + state_.ToString());
    return status;
}

bool PersonalityStateManager::ApplyTrustEffects(const PlayerAction& action, bool pattern_confirmed) {
    const Timestamp now = action.timestamp;

    if (action.action_type == ActionType::APOLOGY) {
        std::string behavior = action.GetMetadata("behavior_type", "GENERAL");
        ApologyType apology_type = ApologyType::GENERIC;
        std::string raw_type = action.GetMetadata("apology_type");
        if (!raw_type.empty()) {
            try {
                apology_type = ParseApologyType(raw_type);
            } catch (const std::invalid_argument& e) {
                std::cerr << "[PersonalityStateManager] " << e.what()
                          << "; treating apology as GENERIC" << std::endl;
            }
        }

        float applied = trust_.RecordApology(behavior, apology_type, now);
        return trust_.AdjustTrust(applied * config_.apology_trust_repair).has_value() &&
               trust_.UpdateResentment(-applied * config_.apology_resentment_relief, false).has_value();
    }

    float scale = 1.0f;
    if (action.valence < 0.0f && pattern_confirmed) {
        scale *= config_.pattern_trust_multiplier;
    }
    if (action.action_type == ActionType::PARENTING_PRESENT && action.valence > 0.0f) {
        scale *= 0.5f + 0.5f * ParentingConsistencyLocked(now);
    }
    if (action.valence < 0.0f && emotional_safety_ > config_.safety_buffer_threshold &&
        !IsDismissal(action.action_type)) {
        scale *= config_.safety_buffer_factor;
    }

    if (!trust_.UpdateTrust(action.valence, action.context, action.action_type, scale, now)) {
        return false;
    }

    if (action.valence < 0.0f) {
        // Conflict avoidance adds resentment through the avoidance sub-tracker
        if (action.action_type != ActionType::CONFLICT_AVOID &&
            !trust_.UpdateResentment(-action.valence, pattern_confirmed)) {
            return false;
        }

        std::string behavior = ToString(action.action_type);
        if (trust_.GetApologyRecords().count(behavior) > 0) {
            trust_.RecordBehaviorRecurrence(behavior, now);
        }
    }

    return true;
}

bool PersonalityStateManager::ApplySecondaryEffects(const PlayerAction& action, bool* unreliable) {
    const Timestamp now = action.timestamp;
    const float magnitude = std::fabs(action.valence);

    switch (action.action_type) {
        case ActionType::STRESS_ACKNOWLEDGED:
        case ActionType::EMPATHY_SHOWN:
            emotional_safety_ += config_.acknowledgment_rate * magnitude;
            break;

        case ActionType::STRESS_DISMISSED:
        case ActionType::EMPATHY_LACKING:
            emotional_safety_ -= config_.dismissal_rate * magnitude;
            break;

        case ActionType::PUBLIC_SUPPORT:
            if (action.context == ContextType::PUBLIC) {
                parenting_unity_ += config_.unity_rate * magnitude;
            }
            break;

        case ActionType::PUBLIC_CONTRADICTION:
            if (action.context == ContextType::PUBLIC) {
                parenting_unity_ -= config_.unity_rate * magnitude;
            }
            break;

        case ActionType::CONFLICT_ENGAGE:
            if (!trust_.UpdateResentment(-config_.engagement_relief * magnitude, false)) {
                return false;
            }
            break;

        case ActionType::CONFLICT_AVOID: {
            size_t avoidances = tracker_.CountInWindow(PatternType::REPEATED_AVOIDANCE,
                                                       config_.sub_pattern_window, now);
            if (avoidances >= config_.sub_pattern_threshold) {
                if (!trust_.UpdateResentment(magnitude, true)) {
                    return false;
                }
                *unreliable = true;
                LogDebug("Repeated conflict avoidance (" + std::to_string(avoidances) +
                         " in window), flagging unreliable");
            } else if (!trust_.UpdateResentment(-config_.avoidance_relief * magnitude, false)) {
                return false;
            }
            break;
        }

        case ActionType::INITIATION_RESPONSE:
            if (action.valence > 0.0f) {
                ++initiation_streak_;
            } else {
                initiation_streak_ = 0;
            }
            break;

        default:
            break;
    }

    emotional_safety_ = Clamp(RoundTo2(emotional_safety_), 0.0f, 100.0f);
    parenting_unity_ = Clamp(RoundTo2(parenting_unity_), 0.0f, 100.0f);
    return true;
}

void PersonalityStateManager::StoreInteraction(const PlayerAction& action,
                                               bool pattern_confirmed,
                                               bool unreliable) {
    InteractionSummary summary;
    summary.interaction_id = "interaction-" + std::to_string(++interaction_counter_);
    summary.context = action.context;
    summary.timestamp = action.timestamp;
    summary.flagged_unreliable = unreliable;

    PatternType signature;
    if (PatternForAction(action.action_type, &signature) &&
        tracker_.HasPattern(signature, action.timestamp)) {
        summary.associated_patterns.insert(signature);
    }

    EmotionalImpact impact;
    impact.primary_emotion = EmotionFor(action.action_type, action.valence, pattern_confirmed);
    impact.intensity = std::fabs(action.valence);
    impact.valence = action.valence;
    impact.context_category = CategoryForAction(action.action_type);

    memory_.StoreMemory(summary, impact, action.timestamp);
}

// ============================================================================
// Derived State
// ============================================================================

void PersonalityStateManager::RecomputeDerived(Timestamp now, bool ramp) {
    ResponseModifiers target = ComputeTargetModifiers(now);

    if (ramp && recovering_ && !trust_.IsInWithdrawal()) {
        auto step_toward = [this](float current, float goal) {
            if (goal <= current) {
                return goal;
            }
            return RoundTo2(std::min(goal, current + config_.recovery_step));
        };

        modifiers_.response_length_multiplier =
            step_toward(modifiers_.response_length_multiplier, target.response_length_multiplier);
        modifiers_.initiation_probability =
            step_toward(modifiers_.initiation_probability, target.initiation_probability);
        modifiers_.cooperation_level =
            step_toward(modifiers_.cooperation_level, target.cooperation_level);
        modifiers_.emotional_vulnerability = target.emotional_vulnerability;
        modifiers_.interpretation_bias = target.interpretation_bias;

        if (modifiers_.response_length_multiplier == target.response_length_multiplier &&
            modifiers_.initiation_probability == target.initiation_probability &&
            modifiers_.cooperation_level == target.cooperation_level) {
            recovering_ = false;
            LogDebug("Recovery complete");
        }
    } else {
        modifiers_ = target;
        recovering_ = false;
    }

    state_.trust_score = trust_.GetTrust();
    state_.resentment_score = trust_.GetResentment();
    state_.emotional_safety = emotional_safety_;
    state_.parenting_unity = parenting_unity_;
    state_.is_withdrawn = trust_.IsInWithdrawal();
    state_.withdrawal_severity = trust_.GetWithdrawalLevel();

    state_.recent_patterns.clear();
    for (const auto& pattern : tracker_.GetAllPatterns(now)) {
        state_.recent_patterns.push_back(pattern.pattern_type);
    }
    state_.dominant_emotions = memory_.GetDominantEmotions(config_.dominant_emotion_count, now);
}

ResponseModifiers PersonalityStateManager::ComputeTargetModifiers(Timestamp now) const {
    const float trust = trust_.GetTrust();
    const float resentment = trust_.GetResentment();
    const ModifierPreset& preset = LookupPreset(TrustBandFor(trust), ResentmentBandFor(resentment));

    ResponseModifiers modifiers;
    modifiers.response_length_multiplier = RoundTo2(Clamp(preset.response_length, 0.3f, 1.0f));

    // Sustained control taking erodes cooperation in proportion to frequency
    float cooperation = preset.cooperation;
    size_t control = tracker_.CountInWindow(PatternType::CONTROL_TAKING,
                                            config_.sub_pattern_window, now);
    if (control >= config_.sub_pattern_threshold) {
        double days = std::max(1.0, DurationDays(config_.sub_pattern_window));
        float frequency = static_cast<float>(control / days);
        cooperation *= 1.0f - std::min(config_.max_cooperation_penalty,
                                       frequency * config_.cooperation_penalty_rate);
    }
    modifiers.cooperation_level = RoundTo2(Clamp(cooperation, 0.0f, 1.0f));

    float initiation;
    if (trust > 70.0f) {
        initiation = config_.initiation_baseline;
    } else if (trust >= 40.0f) {
        initiation = std::max(config_.initiation_minimum,
                              config_.initiation_baseline * (trust - 40.0f) / 30.0f);
    } else {
        initiation = config_.initiation_minimum;
    }
    if (resentment > 50.0f) {
        initiation *= 0.5f;
    }
    if (initiation_streak_ >= config_.initiation_streak_required) {
        initiation += config_.initiation_boost;
    }
    modifiers.initiation_probability = RoundTo2(Clamp(initiation, 0.0f, 1.0f));

    float vulnerability = preset.vulnerability_scale * (0.5f + 0.5f * emotional_safety_ / 100.0f);
    modifiers.emotional_vulnerability = RoundTo2(Clamp(vulnerability, 0.0f, 1.0f));

    float bias = 0.0f;
    if (trust > 70.0f) {
        bias += (trust - 70.0f) / 30.0f;
    }
    if (resentment > 50.0f) {
        bias -= (resentment - 50.0f) / 50.0f;
    }
    modifiers.interpretation_bias = RoundTo2(Clamp(bias, -1.0f, 1.0f));

    return modifiers;
}

float PersonalityStateManager::ParentingConsistencyLocked(Timestamp now) const {
    const int window_days = std::max(1, static_cast<int>(std::lround(DurationDays(config_.sub_pattern_window))));
    std::vector<double> counts(window_days, 0.0);
    size_t total = 0;
    int span = 0;

    for (const auto& action : tracker_.GetActionsInWindow(config_.sub_pattern_window, now)) {
        if (action->action_type != ActionType::PARENTING_PRESENT || action->valence <= 0.0f) {
            continue;
        }
        auto index = static_cast<int>((now - action->timestamp) / kOneDay);
        if (index < 0 || index >= window_days) {
            continue;
        }
        counts[index] += 1.0;
        ++total;
        span = std::max(span, index + 1);
    }

    if (total <= 1) {
        return 1.0f;
    }

    // Days before the first involvement in the window do not count as gaps
    double mean = static_cast<double>(total) / span;
    double variance = 0.0;
    for (int i = 0; i < span; ++i) {
        variance += (counts[i] - mean) * (counts[i] - mean);
    }
    variance /= span;

    double cv = std::sqrt(variance) / mean;
    return RoundTo2(Clamp(static_cast<float>(1.0 - cv), 0.0f, 1.0f));
}

// ============================================================================
// Queries
// ============================================================================

PersonalityState PersonalityStateManager::GetCurrentState() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

ResponseModifiers PersonalityStateManager::GetResponseModifiers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return modifiers_;
}

float PersonalityStateManager::GetParentingConsistency(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ParentingConsistencyLocked(now);
}

std::optional<Timestamp> PersonalityStateManager::GetLastProcessed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_processed_;
}

// ============================================================================
// Snapshot
// ============================================================================

RelationshipSnapshot PersonalityStateManager::CreateSnapshot(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    RelationshipSnapshot snapshot;
    snapshot.timestamp = now;
    snapshot.trust_score = trust_.GetTrust();
    snapshot.resentment_score = trust_.GetResentment();
    snapshot.emotional_safety = emotional_safety_;
    snapshot.parenting_unity = parenting_unity_;
    snapshot.patterns = tracker_.GetStoredPatterns();
    snapshot.emotional_memories = memory_.GetMemories();
    snapshot.apology_effectiveness = trust_.GetApologyRecords();

    snapshot.action_history.reserve(tracker_.GetHistorySize());
    for (const auto& action : tracker_.GetHistory()) {
        snapshot.action_history.push_back(*action);
    }
    snapshot.broken_patterns = tracker_.GetBrokenAt();
    snapshot.trust_positive_streak = trust_.GetPositiveStreak();
    snapshot.initiation_streak = initiation_streak_;

    return snapshot;
}

void PersonalityStateManager::RestoreSnapshot(const RelationshipSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    tracker_.Restore(snapshot.action_history, snapshot.patterns, snapshot.broken_patterns);
    memory_.Restore(snapshot.emotional_memories);
    trust_.Restore(snapshot.trust_score, snapshot.resentment_score,
                   snapshot.apology_effectiveness, snapshot.trust_positive_streak);

    emotional_safety_ = Clamp(RoundTo2(snapshot.emotional_safety), 0.0f, 100.0f);
    parenting_unity_ = Clamp(RoundTo2(snapshot.parenting_unity), 0.0f, 100.0f);
    initiation_streak_ = snapshot.initiation_streak;
    interaction_counter_ = snapshot.emotional_memories.size();

    last_processed_.reset();
    if (!tracker_.GetHistory().empty()) {
        last_processed_ = tracker_.GetHistory().back()->timestamp;
    }
    if (!memory_.GetMemories().empty()) {
        Timestamp latest = memory_.GetMemories().back().timestamp;
        if (!last_processed_ || latest > *last_processed_) {
            last_processed_ = latest;
        }
    }
    if (last_processed_) {
        tracker_.ClearHistory(*last_processed_ - HistoryRetention());
    }

    recovering_ = false;
    RecomputeDerived(last_processed_.value_or(snapshot.timestamp), false);

    LogDebug("Restored snapshot from " + snapshot.timestamp.ToIso8601());
}

void PersonalityStateManager::Reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    tracker_.ClearHistory();
    memory_.Clear();
    trust_.Reset();
    emotional_safety_ = config_.initial_emotional_safety;
    parenting_unity_ = config_.initial_parenting_unity;
    initiation_streak_ = 0;
    interaction_counter_ = 0;
    last_processed_.reset();
    recovering_ = false;

    RecomputeDerived(Timestamp::Now(), false);
}

// ============================================================================
// Helper Methods
// ============================================================================

bool PersonalityStateManager::StateIsFinite() const {
    return std::isfinite(trust_.GetTrust()) &&
           std::isfinite(trust_.GetResentment()) &&
           std::isfinite(emotional_safety_) &&
           std::isfinite(parenting_unity_);
}

Timestamp::Duration PersonalityStateManager::HistoryRetention() const {
    return std::max(config_.patterns.time_window, config_.sub_pattern_window);
}

PersonalityStateManager::Checkpoint PersonalityStateManager::MakeCheckpoint() const {
    return Checkpoint{trust_, emotional_safety_, parenting_unity_,
                      initiation_streak_, modifiers_, recovering_};
}

void PersonalityStateManager::RestoreCheckpoint(const Checkpoint& checkpoint) {
    trust_ = checkpoint.trust;
    emotional_safety_ = checkpoint.emotional_safety;
    parenting_unity_ = checkpoint.parenting_unity;
    initiation_streak_ = checkpoint.initiation_streak;
    modifiers_ = checkpoint.modifiers;
    recovering_ = checkpoint.recovering;
}

void PersonalityStateManager::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[PersonalityStateManager] " << message << std::endl;
    }
}

} // namespace tether
