// File: src/memory/emotional_memory.cpp
//
// Implementation of EmotionalMemorySystem

#include "memory/emotional_memory.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace tether {

namespace {

Timestamp::Duration DaysToDuration(double days) {
    return std::chrono::duration_cast<Timestamp::Duration>(
        std::chrono::duration<double, std::ratio<86400>>(days));
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

EmotionalMemorySystem::EmotionalMemorySystem()
    : EmotionalMemorySystem(Config())
{
}

EmotionalMemorySystem::EmotionalMemorySystem(const Config& config)
    : config_(config)
{
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid EmotionalMemorySystem configuration");
    }
}

// ============================================================================
// Storage
// ============================================================================

EmotionalMemory EmotionalMemorySystem::StoreMemory(const InteractionSummary& summary,
                                                   const EmotionalImpact& impact,
                                                   Timestamp now) {
    EmotionalMemory memory;
    memory.interaction_id = summary.interaction_id;
    memory.emotional_impact = impact;
    memory.emotional_impact.intensity = RoundTo2(Clamp(impact.intensity, 0.0f, 1.0f));
    memory.emotional_impact.valence = RoundTo2(Clamp(impact.valence, -1.0f, 1.0f));
    memory.timestamp = summary.timestamp;
    memory.context = summary.context;
    memory.weight = 1.0f;
    memory.associated_patterns = summary.associated_patterns;
    memory.flagged_unreliable = summary.flagged_unreliable;

    if (memories_.empty() || memories_.back().timestamp <= memory.timestamp) {
        memories_.push_back(memory);
    } else {
        auto pos = std::upper_bound(
            memories_.begin(), memories_.end(), memory.timestamp,
            [](Timestamp time, const EmotionalMemory& entry) { return time < entry.timestamp; });
        memories_.insert(pos, memory);
    }

    LogDebug("Stored memory " + memory.interaction_id + " (" +
             ToString(impact.primary_emotion) + ", " +
             ToString(impact.context_category) + ")");

    if (memories_.size() > config_.max_memories) {
        PruneToCapacity(now);
    }

    return memory;
}

// ============================================================================
// Recall
// ============================================================================

std::vector<EmotionalMemory> EmotionalMemorySystem::RecallSimilar(
    ContextType context,
    size_t limit,
    Timestamp now,
    std::optional<ContextCategory> category) const {

    std::vector<EmotionalMemory> matches;
    if (limit == 0) {
        return matches;
    }

    for (const auto& memory : memories_) {
        if (memory.context != context) {
            continue;
        }
        if (category && memory.emotional_impact.context_category != *category) {
            continue;
        }
        matches.push_back(WithLiveWeight(memory, now));
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const EmotionalMemory& a, const EmotionalMemory& b) {
                         if (a.weight != b.weight) {
                             return a.weight > b.weight;
                         }
                         return a.timestamp > b.timestamp;
                     });

    if (matches.size() > limit) {
        matches.resize(limit);
    }
    return matches;
}

float EmotionalMemorySystem::GetEmotionalAssociation(ContextCategory category, Timestamp now) const {
    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (const auto& memory : memories_) {
        if (memory.emotional_impact.context_category != category) {
            continue;
        }
        float weight = LiveWeight(memory, now);
        weighted_sum += static_cast<double>(memory.emotional_impact.valence) * weight;
        total_weight += weight;
    }

    if (total_weight <= 0.0) {
        return 0.0f;
    }
    return RoundTo2(Clamp(static_cast<float>(weighted_sum / total_weight), -1.0f, 1.0f));
}

std::vector<EmotionalMemory> EmotionalMemorySystem::GetRecentMemories(double hours,
                                                                      size_t limit,
                                                                      Timestamp now) const {
    std::vector<EmotionalMemory> result;
    Timestamp cutoff = now - std::chrono::duration_cast<Timestamp::Duration>(
        std::chrono::duration<double, std::ratio<3600>>(hours));

    for (auto it = memories_.rbegin(); it != memories_.rend() && result.size() < limit; ++it) {
        if (it->timestamp < cutoff) {
            break;
        }
        if (it->timestamp <= now) {
            result.push_back(WithLiveWeight(*it, now));
        }
    }
    return result;
}

std::vector<EmotionalMemory> EmotionalMemorySystem::GetMemoriesByEmotion(EmotionType emotion,
                                                                         Timestamp now) const {
    std::vector<EmotionalMemory> result;
    for (const auto& memory : memories_) {
        if (memory.emotional_impact.primary_emotion == emotion) {
            result.push_back(WithLiveWeight(memory, now));
        }
    }
    return result;
}

std::vector<EmotionalMemory> EmotionalMemorySystem::GetMemoriesByPattern(PatternType pattern,
                                                                         Timestamp now) const {
    std::vector<EmotionalMemory> result;
    for (const auto& memory : memories_) {
        if (memory.associated_patterns.count(pattern) > 0) {
            result.push_back(WithLiveWeight(memory, now));
        }
    }
    return result;
}

float EmotionalMemorySystem::GetAverageValence(std::optional<ContextCategory> category,
                                               double days,
                                               Timestamp now) const {
    Timestamp cutoff = now - DaysToDuration(days);
    double sum = 0.0;
    size_t count = 0;

    for (const auto& memory : memories_) {
        if (memory.timestamp < cutoff || memory.timestamp > now) {
            continue;
        }
        if (category && memory.emotional_impact.context_category != *category) {
            continue;
        }
        sum += memory.emotional_impact.valence;
        ++count;
    }

    return count > 0 ? RoundTo2(static_cast<float>(sum / count)) : 0.0f;
}

std::vector<EmotionType> EmotionalMemorySystem::GetDominantEmotions(size_t limit, Timestamp now) const {
    std::map<EmotionType, double> scores;
    for (const auto& memory : memories_) {
        scores[memory.emotional_impact.primary_emotion] +=
            static_cast<double>(memory.emotional_impact.intensity) * LiveWeight(memory, now);
    }

    std::vector<std::pair<EmotionType, double>> ranked(scores.begin(), scores.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<EmotionType> result;
    for (const auto& [emotion, score] : ranked) {
        if (result.size() >= limit || score <= 0.0) {
            break;
        }
        result.push_back(emotion);
    }
    return result;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t EmotionalMemorySystem::ApplyTemporalDecay(Timestamp now) {
    size_t changed = 0;
    for (auto& memory : memories_) {
        float weight = LiveWeight(memory, now);
        if (weight != memory.weight) {
            memory.weight = weight;
            ++changed;
        }
    }
    return changed;
}

size_t EmotionalMemorySystem::ClearOldMemories(double days, Timestamp now) {
    Timestamp cutoff = now - DaysToDuration(days);
    size_t before = memories_.size();

    memories_.erase(
        std::remove_if(memories_.begin(), memories_.end(),
                       [cutoff](const EmotionalMemory& m) { return m.timestamp < cutoff; }),
        memories_.end());

    size_t removed = before - memories_.size();
    LogDebug("Cleared " + std::to_string(removed) + " old memories");
    return removed;
}

bool EmotionalMemorySystem::HasUnreliableFlag() const {
    return std::any_of(memories_.begin(), memories_.end(),
                       [](const EmotionalMemory& m) { return m.flagged_unreliable; });
}

void EmotionalMemorySystem::Restore(const std::vector<EmotionalMemory>& memories) {
    memories_ = memories;
    std::stable_sort(memories_.begin(), memories_.end(),
                     [](const EmotionalMemory& a, const EmotionalMemory& b) {
                         return a.timestamp < b.timestamp;
                     });
    LogDebug("Restored " + std::to_string(memories_.size()) + " memories");
}

void EmotionalMemorySystem::Clear() {
    memories_.clear();
    total_pruned_ = 0;
}

EmotionalMemorySystem::Stats EmotionalMemorySystem::GetStats() const {
    Stats stats;
    stats.total_memories = memories_.size();
    stats.total_pruned = total_pruned_;

    double valence_sum = 0.0;
    for (const auto& memory : memories_) {
        if (memory.flagged_unreliable) {
            ++stats.unreliable_memories;
        }
        ++stats.emotion_counts[memory.emotional_impact.primary_emotion];
        ++stats.category_counts[memory.emotional_impact.context_category];
        valence_sum += memory.emotional_impact.valence;
    }

    if (!memories_.empty()) {
        stats.average_valence = RoundTo2(static_cast<float>(valence_sum / memories_.size()));
    }
    return stats;
}

// ============================================================================
// Helper Methods
// ============================================================================

float EmotionalMemorySystem::LiveWeight(const EmotionalMemory& memory, Timestamp now) const {
    return decay_.ApplyDecay(1.0f, now - memory.timestamp);
}

EmotionalMemory EmotionalMemorySystem::WithLiveWeight(const EmotionalMemory& memory, Timestamp now) const {
    EmotionalMemory copy = memory;
    copy.weight = LiveWeight(memory, now);
    return copy;
}

size_t EmotionalMemorySystem::PruneToCapacity(Timestamp now) {
    size_t excess = memories_.size() - config_.max_memories;

    // Candidates: unprotected memories, lowest weight first, then oldest
    std::vector<size_t> candidates;
    for (size_t i = 0; i < memories_.size(); ++i) {
        if (LiveWeight(memories_[i], now) <= config_.protected_weight) {
            candidates.push_back(i);
        }
    }

    if (candidates.empty()) {
        std::cerr << "[EmotionalMemorySystem] Over capacity ("
                  << memories_.size() << "/" << config_.max_memories
                  << ") but every memory is protected" << std::endl;
        return 0;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [this, now](size_t a, size_t b) {
                         float wa = LiveWeight(memories_[a], now);
                         float wb = LiveWeight(memories_[b], now);
                         if (wa != wb) {
                             return wa < wb;
                         }
                         return memories_[a].timestamp < memories_[b].timestamp;
                     });

    if (candidates.size() > excess) {
        candidates.resize(excess);
    }

    std::vector<bool> doomed(memories_.size(), false);
    for (size_t index : candidates) {
        doomed[index] = true;
    }

    std::vector<EmotionalMemory> kept;
    kept.reserve(memories_.size() - candidates.size());
    for (size_t i = 0; i < memories_.size(); ++i) {
        if (!doomed[i]) {
            kept.push_back(std::move(memories_[i]));
        }
    }
    memories_ = std::move(kept);

    total_pruned_ += candidates.size();
    std::cerr << "[EmotionalMemorySystem] Pruned " << candidates.size()
              << " memories (capacity " << config_.max_memories << ")" << std::endl;

    return candidates.size();
}

void EmotionalMemorySystem::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[EmotionalMemorySystem] " << message << std::endl;
    }
}

} // namespace tether
