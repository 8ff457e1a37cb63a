// File: src/personality/pattern_tracker.cpp
#include "personality/pattern_tracker.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace tether {

namespace {

bool EarlierThan(const ActionRef& action, Timestamp time) {
    return action->timestamp < time;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

PatternTracker::PatternTracker()
    : PatternTracker(Config())
{
}

PatternTracker::PatternTracker(const Config& config)
    : config_(config),
      decay_(config.daily_decay_rate)
{
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid PatternTracker configuration");
    }
}

// ============================================================================
// Recording
// ============================================================================

ActionRef PatternTracker::RecordAction(const PlayerAction& action) {
    auto stored = std::make_shared<const PlayerAction>(action);
    InsertOrdered(stored);

    // A recurrence restores a live pattern to full weight
    PatternType type;
    if (PatternForAction(action.action_type, &type)) {
        auto it = detected_.find(type);
        if (it != detected_.end() && Counts(stored, type) &&
            DecayedWeight(it->second, action.timestamp) > 0.0f) {
            BehaviorPattern& pattern = it->second;
            pattern.occurrences.push_back(stored);
            if (action.timestamp > pattern.last_seen) {
                pattern.last_seen = action.timestamp;
            }
            pattern.weight = 1.0f;
        }
    }

    UpdateOpposingCounters(action);

    for (const auto& [negative_type, count] : consecutive_opposing_) {
        if (count >= config_.break_threshold && HasPattern(negative_type, action.timestamp)) {
            BreakPattern(negative_type, action.timestamp);
        }
    }

    return stored;
}

void PatternTracker::UpdateOpposingCounters(const PlayerAction& action) {
    PatternType matched;
    bool has_signature = PatternForAction(action.action_type, &matched);

    for (PatternType type : AllPatternTypes()) {
        if (!IsNegativePattern(type)) {
            continue;
        }
        uint32_t& counter = consecutive_opposing_[type];
        if (has_signature && matched == type) {
            counter = 0;
        } else if (action.valence > config_.opposing_valence_threshold) {
            ++counter;
        } else {
            counter = 0;
        }
    }
}

void PatternTracker::InsertOrdered(const ActionRef& action) {
    if (history_.empty() || history_.back()->timestamp <= action->timestamp) {
        history_.push_back(action);
        return;
    }
    auto pos = std::upper_bound(
        history_.begin(), history_.end(), action->timestamp,
        [](Timestamp time, const ActionRef& entry) { return time < entry->timestamp; });
    history_.insert(pos, action);
}

// ============================================================================
// Detection
// ============================================================================

std::vector<BehaviorPattern> PatternTracker::DetectPatterns(Timestamp now) {
    return DetectPatterns(config_.time_window, now);
}

std::vector<BehaviorPattern> PatternTracker::DetectPatterns(Timestamp::Duration window, Timestamp now) {
    std::map<PatternType, std::vector<ActionRef>> groups;

    Timestamp start = now - window;
    auto it = std::lower_bound(history_.begin(), history_.end(), start, EarlierThan);
    for (; it != history_.end() && (*it)->timestamp <= now; ++it) {
        PatternType type;
        if (PatternForAction((*it)->action_type, &type) && Counts(*it, type)) {
            groups[type].push_back(*it);
        }
    }

    std::vector<BehaviorPattern> result;
    const double days = WindowDays(window);

    for (auto& [type, actions] : groups) {
        if (actions.size() < config_.min_occurrences) {
            continue;
        }

        float frequency = static_cast<float>(actions.size() / days);
        auto found = detected_.find(type);

        if (found != detected_.end() && DecayedWeight(found->second, now) > 0.0f) {
            BehaviorPattern& pattern = found->second;
            if (actions.back()->timestamp > pattern.last_seen) {
                pattern.last_seen = actions.back()->timestamp;
                pattern.weight = 1.0f;
            }
            pattern.occurrences = actions;
            pattern.frequency = frequency;
        } else {
            BehaviorPattern pattern;
            pattern.pattern_type = type;
            pattern.occurrences = actions;
            pattern.frequency = frequency;
            pattern.weight = 1.0f;
            pattern.first_seen = actions.front()->timestamp;
            pattern.last_seen = actions.back()->timestamp;
            detected_[type] = pattern;
            LogDebug(std::string("Pattern formed: ") + ToString(type) +
                     " (" + std::to_string(actions.size()) + " occurrences)");
        }

        BehaviorPattern reported = detected_[type];
        reported.weight = DecayedWeight(reported, now);
        result.push_back(std::move(reported));
    }

    // Drop patterns that have decayed away
    for (auto p = detected_.begin(); p != detected_.end();) {
        if (DecayedWeight(p->second, now) <= 0.0f) {
            LogDebug(std::string("Pattern dissolved: ") + ToString(p->first));
            p = detected_.erase(p);
        } else {
            ++p;
        }
    }

    return result;
}

float PatternTracker::GetPatternFrequency(PatternType type, Timestamp now) const {
    size_t count = CountInWindow(type, config_.time_window, now);
    return static_cast<float>(count / WindowDays(config_.time_window));
}

float PatternTracker::GetPatternWeight(PatternType type, Timestamp now) const {
    auto it = detected_.find(type);
    if (it == detected_.end()) {
        return 0.0f;
    }
    return DecayedWeight(it->second, now);
}

bool PatternTracker::BreakPattern(PatternType type, Timestamp now) {
    if (!IsNegativePattern(type)) {
        return false;
    }
    auto counter = consecutive_opposing_.find(type);
    if (counter == consecutive_opposing_.end() || counter->second < config_.break_threshold) {
        return false;
    }

    detected_.erase(type);
    broken_at_[type] = now;
    counter->second = 0;

    LogDebug(std::string("Pattern broken: ") + ToString(type));
    return true;
}

bool PatternTracker::HasPattern(PatternType type, Timestamp now) const {
    return GetPatternWeight(type, now) > 0.0f;
}

std::vector<BehaviorPattern> PatternTracker::GetAllPatterns(Timestamp now) const {
    std::vector<BehaviorPattern> result;
    for (const auto& [type, pattern] : detected_) {
        float weight = DecayedWeight(pattern, now);
        if (weight > 0.0f) {
            BehaviorPattern reported = pattern;
            reported.weight = weight;
            result.push_back(std::move(reported));
        }
    }
    return result;
}

std::vector<BehaviorPattern> PatternTracker::GetStoredPatterns() const {
    std::vector<BehaviorPattern> result;
    result.reserve(detected_.size());
    for (const auto& [type, pattern] : detected_) {
        result.push_back(pattern);
    }
    return result;
}

size_t PatternTracker::CountInWindow(PatternType type, Timestamp::Duration window, Timestamp now) const {
    size_t count = 0;
    auto it = std::lower_bound(history_.begin(), history_.end(), now - window, EarlierThan);
    for (; it != history_.end() && (*it)->timestamp <= now; ++it) {
        PatternType mapped;
        if (PatternForAction((*it)->action_type, &mapped) && mapped == type && Counts(*it, type)) {
            ++count;
        }
    }
    return count;
}

std::vector<ActionRef> PatternTracker::GetActionsInWindow(Timestamp::Duration window, Timestamp now) const {
    auto first = std::lower_bound(history_.begin(), history_.end(), now - window, EarlierThan);
    auto last = std::upper_bound(
        first, history_.end(), now,
        [](Timestamp time, const ActionRef& entry) { return time < entry->timestamp; });
    return std::vector<ActionRef>(first, last);
}

uint32_t PatternTracker::GetConsecutiveOpposing(PatternType type) const {
    auto it = consecutive_opposing_.find(type);
    return it != consecutive_opposing_.end() ? it->second : 0;
}

// ============================================================================
// Maintenance
// ============================================================================

void PatternTracker::ClearHistory() {
    history_.clear();
    detected_.clear();
    consecutive_opposing_.clear();
    broken_at_.clear();
}

void PatternTracker::ClearHistory(Timestamp cutoff) {
    auto keep_from = std::lower_bound(history_.begin(), history_.end(), cutoff, EarlierThan);
    history_.erase(history_.begin(), keep_from);
}

void PatternTracker::Restore(const std::vector<PlayerAction>& history,
                             const std::vector<BehaviorPattern>& patterns,
                             const std::map<PatternType, Timestamp>& broken_at) {
    ClearHistory();

    for (const auto& action : history) {
        InsertOrdered(std::make_shared<const PlayerAction>(action));
    }

    auto find_or_insert = [this](const PlayerAction& action) -> ActionRef {
        auto range_start = std::lower_bound(history_.begin(), history_.end(),
                                            action.timestamp, EarlierThan);
        for (auto it = range_start; it != history_.end() && (*it)->timestamp == action.timestamp; ++it) {
            if ((*it)->action_type == action.action_type && (*it)->context == action.context) {
                return *it;
            }
        }
        auto stored = std::make_shared<const PlayerAction>(action);
        InsertOrdered(stored);
        return stored;
    };

    for (const auto& saved : patterns) {
        BehaviorPattern pattern = saved;
        pattern.occurrences.clear();
        for (const auto& occurrence : saved.occurrences) {
            if (occurrence) {
                pattern.occurrences.push_back(find_or_insert(*occurrence));
            }
        }
        detected_[pattern.pattern_type] = std::move(pattern);
    }

    broken_at_ = broken_at;
}

// ============================================================================
// Helper Methods
// ============================================================================

float PatternTracker::DecayedWeight(const BehaviorPattern& pattern, Timestamp now) const {
    float weight = decay_.ApplyDecay(pattern.weight, now - pattern.last_seen);
    return weight < config_.removal_threshold ? 0.0f : weight;
}

bool PatternTracker::Counts(const ActionRef& action, PatternType type) const {
    auto broken = broken_at_.find(type);
    return broken == broken_at_.end() || action->timestamp > broken->second;
}

double PatternTracker::WindowDays(Timestamp::Duration window) const {
    double days = std::chrono::duration_cast<std::chrono::duration<double, std::ratio<86400>>>(window).count();
    return days < 1.0 ? 1.0 : days;
}

void PatternTracker::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[PatternTracker] " << message << std::endl;
    }
}

} // namespace tether
