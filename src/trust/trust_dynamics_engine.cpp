// File: src/trust/trust_dynamics_engine.cpp
//
// Implementation of TrustDynamicsEngine

#include "trust/trust_dynamics_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace tether {

// ============================================================================
// Config
// ============================================================================

bool TrustDynamicsEngine::Config::IsValid() const {
    auto in_score_range = [](float v) { return std::isfinite(v) && v >= 0.0f && v <= 100.0f; };
    auto in_unit_range = [](float v) { return std::isfinite(v) && v >= 0.0f && v <= 1.0f; };

    if (!in_score_range(initial_trust) || !in_score_range(initial_resentment)) {
        return false;
    }
    if (positive_rate <= 0.0f || negative_rate <= 0.0f || public_multiplier < 1.0f) {
        return false;
    }
    if (diminishing_window.count() < 0 || !in_unit_range(diminishing_cap)) {
        return false;
    }
    if (!in_score_range(resilience_threshold) || !in_unit_range(resilience_factor)) {
        return false;
    }
    if (!in_score_range(dampening_threshold) || !in_unit_range(dampening_factor)) {
        return false;
    }
    if (pattern_resentment_rate < 0.0f || isolated_resentment_rate < 0.0f ||
        resentment_daily_decay < 0.0f) {
        return false;
    }
    if (!in_score_range(withdrawal_threshold) ||
        !in_score_range(withdrawal_exit_threshold) ||
        withdrawal_exit_threshold < withdrawal_threshold) {
        return false;
    }
    if (!(moderate_floor <= mild_floor && mild_floor <= withdrawal_threshold)) {
        return false;
    }
    if (!in_unit_range(apology_recurrence_penalty) || !in_unit_range(apology_floor) ||
        !in_unit_range(apology_weekly_recovery)) {
        return false;
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

TrustDynamicsEngine::TrustDynamicsEngine()
    : TrustDynamicsEngine(Config())
{
}

TrustDynamicsEngine::TrustDynamicsEngine(const Config& config)
    : config_(config),
      trust_(config.initial_trust),
      resentment_(config.initial_resentment)
{
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid TrustDynamicsEngine configuration");
    }
    UpdateWithdrawal();
}

// ============================================================================
// Trust
// ============================================================================

float TrustDynamicsEngine::ComputeTrustDelta(float valence,
                                             ContextType context,
                                             ActionType kind,
                                             float scale,
                                             Timestamp now) const {
    // 1. Asymmetric base rate
    float delta = valence >= 0.0f ? valence * config_.positive_rate
                                  : valence * config_.negative_rate;

    // 2. Public amplification
    if (context == ContextType::PUBLIC && kind != ActionType::PRIVATE_CORRECTION) {
        delta *= config_.public_multiplier;
    }
    delta *= scale;

    // 3. Diminishing returns for repeated positive actions
    if (delta > 0.0f) {
        auto it = impact_windows_.find(kind);
        if (it != impact_windows_.end() &&
            now >= it->second.start &&
            now - it->second.start <= config_.diminishing_window) {
            delta = std::min(delta, config_.diminishing_cap * it->second.first_impact);
        }
    }

    // 4. High-trust resilience
    if (delta < 0.0f && trust_ > config_.resilience_threshold) {
        delta *= config_.resilience_factor;
    }

    // 5. Resentment dampening
    if (delta > 0.0f && resentment_ > config_.dampening_threshold) {
        delta *= config_.dampening_factor;
    }

    return delta;
}

std::optional<float> TrustDynamicsEngine::UpdateTrust(float valence,
                                                      ContextType context,
                                                      ActionType kind,
                                                      float scale,
                                                      Timestamp now) {
    float delta = ComputeTrustDelta(valence, context, kind, scale, now);
    if (!std::isfinite(delta)) {
        std::cerr << "[TrustDynamicsEngine] Discarded non-finite trust update for "
                  << ToString(kind) << std::endl;
        return std::nullopt;
    }

    if (delta > 0.0f) {
        auto it = impact_windows_.find(kind);
        bool window_open = it != impact_windows_.end() &&
                           now >= it->second.start &&
                           now - it->second.start <= config_.diminishing_window;
        if (!window_open) {
            impact_windows_[kind] = ImpactWindow{now, delta};
        }
        ++positive_streak_;
    } else if (delta < 0.0f) {
        positive_streak_ = 0;
    }

    float before = trust_;
    trust_ = Clamp(RoundTo2(trust_ + delta), 0.0f, 100.0f);
    UpdateWithdrawal();

    LogDebug(std::string(ToString(kind)) + ": trust " + std::to_string(before) +
             " -> " + std::to_string(trust_));

    return trust_ - before;
}

std::optional<float> TrustDynamicsEngine::AdjustTrust(float amount) {
    if (!std::isfinite(amount)) {
        std::cerr << "[TrustDynamicsEngine] Discarded non-finite trust adjustment" << std::endl;
        return std::nullopt;
    }
    float before = trust_;
    trust_ = Clamp(RoundTo2(trust_ + amount), 0.0f, 100.0f);
    UpdateWithdrawal();
    return trust_ - before;
}

// ============================================================================
// Resentment
// ============================================================================

std::optional<float> TrustDynamicsEngine::UpdateResentment(float delta, bool is_pattern) {
    if (!std::isfinite(delta)) {
        std::cerr << "[TrustDynamicsEngine] Discarded non-finite resentment update" << std::endl;
        return std::nullopt;
    }

    float change = delta;
    if (delta > 0.0f) {
        change = delta * (is_pattern ? config_.pattern_resentment_rate
                                     : config_.isolated_resentment_rate);
    }

    float before = resentment_;
    resentment_ = Clamp(RoundTo2(resentment_ + change), 0.0f, 100.0f);

    LogDebug(std::string("Resentment ") + (is_pattern ? "(pattern) " : "(isolated) ") +
             std::to_string(before) + " -> " + std::to_string(resentment_));

    return resentment_ - before;
}

float TrustDynamicsEngine::ApplyResentmentDecay(double days) {
    if (!(days > 0.0) || positive_streak_ < config_.decay_streak_required) {
        return 0.0f;
    }

    float before = resentment_;
    float decay = static_cast<float>(days * config_.resentment_daily_decay);
    resentment_ = Clamp(RoundTo2(resentment_ - decay), 0.0f, 100.0f);
    return before - resentment_;
}

// ============================================================================
// Withdrawal
// ============================================================================

WithdrawalLevel TrustDynamicsEngine::GetWithdrawalLevel() const {
    if (!withdrawn_) {
        return WithdrawalLevel::NONE;
    }
    if (trust_ >= config_.mild_floor) {
        return WithdrawalLevel::MILD;
    }
    if (trust_ >= config_.moderate_floor) {
        return WithdrawalLevel::MODERATE;
    }
    return WithdrawalLevel::SEVERE;
}

void TrustDynamicsEngine::UpdateWithdrawal() {
    bool was_withdrawn = withdrawn_;
    if (!withdrawn_ && trust_ < config_.withdrawal_threshold) {
        withdrawn_ = true;
    } else if (withdrawn_ && trust_ >= config_.withdrawal_exit_threshold) {
        withdrawn_ = false;
    }

    if (was_withdrawn != withdrawn_) {
        LogDebug(withdrawn_ ? "Entered withdrawal" : "Left withdrawal");
    }
}

// ============================================================================
// Apologies
// ============================================================================

float TrustDynamicsEngine::ApologyTypeMultiplier(ApologyType type) {
    switch (type) {
        case ApologyType::DEFENSIVE:       return 0.3f;
        case ApologyType::GENERIC:         return 0.5f;
        case ApologyType::GENUINE:         return 1.0f;
        case ApologyType::ACTION_ORIENTED: return 1.5f;
    }
    return 0.5f;
}

float TrustDynamicsEngine::RecordApology(const std::string& behavior_type,
                                         ApologyType apology_type,
                                         Timestamp now) {
    ApologyRecord& record = apologies_[behavior_type];
    float applied = RoundTo2(RecoveredEffectiveness(record, now) * ApologyTypeMultiplier(apology_type));

    record.last_apology = now;
    record.last_apology_type = apology_type;

    LogDebug("Apology for " + behavior_type + " (" + ToString(apology_type) +
             "), effectiveness " + std::to_string(applied));
    return applied;
}

void TrustDynamicsEngine::RecordBehaviorRecurrence(const std::string& behavior_type,
                                                   Timestamp now) {
    ApologyRecord& record = apologies_[behavior_type];

    // Fold in recovery earned up to now before re-anchoring at this recurrence
    float effectiveness = RecoveredEffectiveness(record, now);

    if (record.last_apology && *record.last_apology <= now) {
        effectiveness = std::max(config_.apology_floor,
                                 effectiveness - config_.apology_recurrence_penalty);
    }

    record.effectiveness = RoundTo2(effectiveness);
    record.last_recurrence = now;
    ++record.recurrence_count;

    LogDebug("Recurrence of " + behavior_type + ", stored effectiveness " +
             std::to_string(record.effectiveness));
}

float TrustDynamicsEngine::GetApologyEffectiveness(const std::string& behavior_type,
                                                   ApologyType apology_type,
                                                   Timestamp now) const {
    return RoundTo2(GetStoredEffectiveness(behavior_type, now) * ApologyTypeMultiplier(apology_type));
}

float TrustDynamicsEngine::GetStoredEffectiveness(const std::string& behavior_type,
                                                  Timestamp now) const {
    auto it = apologies_.find(behavior_type);
    if (it == apologies_.end()) {
        return 1.0f;
    }
    return RecoveredEffectiveness(it->second, now);
}

float TrustDynamicsEngine::RecoveredEffectiveness(const ApologyRecord& record, Timestamp now) const {
    if (!record.last_recurrence) {
        return record.effectiveness;
    }
    double weeks = std::floor(ElapsedDays(*record.last_recurrence, now) / 7.0);
    float recovered = record.effectiveness +
                      static_cast<float>(weeks) * config_.apology_weekly_recovery;
    return RoundTo2(std::min(1.0f, recovered));
}

// ============================================================================
// State
// ============================================================================

void TrustDynamicsEngine::Restore(float trust,
                                  float resentment,
                                  const std::map<std::string, ApologyRecord>& apologies,
                                  uint32_t positive_streak) {
    trust_ = Clamp(RoundTo2(trust), 0.0f, 100.0f);
    resentment_ = Clamp(RoundTo2(resentment), 0.0f, 100.0f);
    apologies_ = apologies;
    for (auto& [behavior, record] : apologies_) {
        record.effectiveness = Clamp(record.effectiveness, config_.apology_floor, 1.0f);
    }
    positive_streak_ = positive_streak;
    impact_windows_.clear();

    withdrawn_ = trust_ < config_.withdrawal_threshold;
}

void TrustDynamicsEngine::Reset() {
    trust_ = config_.initial_trust;
    resentment_ = config_.initial_resentment;
    positive_streak_ = 0;
    impact_windows_.clear();
    apologies_.clear();
    withdrawn_ = trust_ < config_.withdrawal_threshold;
}

void TrustDynamicsEngine::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[TrustDynamicsEngine] " << message << std::endl;
    }
}

} // namespace tether
