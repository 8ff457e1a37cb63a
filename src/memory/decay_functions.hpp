// File: src/memory/decay_functions.hpp
#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace tether {

/**
 * @brief Abstract interface for decay functions
 *
 * Decay functions model how pattern weights and memory freshness diminish
 * over time without reinforcement. Every implementation is a pure function
 * of the elapsed time, so weights are computed lazily at read time instead
 * of being ticked by a background timer.
 */
class IDecayFunction {
public:
    virtual ~IDecayFunction() = default;

    /**
     * @brief Apply decay to strength based on elapsed time
     *
     * @param initial_strength The original strength value (typically in [0.0, 1.0])
     * @param elapsed_time Time since last reinforcement
     * @return Decayed strength value
     */
    virtual float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const = 0;

    /**
     * @brief Get the amount of strength lost due to decay
     *
     * @param initial_strength The original strength value
     * @param elapsed_time Time since last reinforcement
     * @return Amount of strength lost (always >= 0)
     */
    virtual float GetDecayAmount(float initial_strength, Timestamp::Duration elapsed_time) const {
        float decayed = ApplyDecay(initial_strength, elapsed_time);
        return initial_strength - decayed;
    }

    /**
     * @brief Get a descriptive name for this decay function
     */
    virtual const char* GetName() const = 0;

    /**
     * @brief Clone this decay function
     */
    virtual std::unique_ptr<IDecayFunction> Clone() const = 0;
};

/**
 * @brief Compounding daily-rate decay
 *
 * Models a fixed fractional loss per elapsed day:
 *   s(t) = s_0 × (1 - r)^(t / 1 day)
 *
 * Elapsed time is taken fractionally, so after exactly one day the strength
 * is (1 - r) × s_0 and after half a day it is (1 - r)^0.5 × s_0. With the
 * default r = 0.1 a pattern loses 10% of its weight per day without
 * recurrence.
 */
class DailyRateDecay : public IDecayFunction {
public:
    /**
     * @param daily_rate Fractional loss per day, clamped to [0.0, 1.0]
     */
    explicit DailyRateDecay(float daily_rate = 0.1f)
        : daily_rate_(std::max(0.0f, std::min(1.0f, daily_rate))) {}

    float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const override {
        if (initial_strength <= 0.0f || daily_rate_ == 0.0f || elapsed_time.count() <= 0) {
            return std::max(0.0f, initial_strength);
        }

        auto days = std::chrono::duration_cast<std::chrono::duration<double, std::ratio<86400>>>(
            elapsed_time).count();

        double factor = std::pow(1.0 - static_cast<double>(daily_rate_), days);
        float decayed = static_cast<float>(initial_strength * factor);

        return std::max(0.0f, std::min(decayed, initial_strength));
    }

    const char* GetName() const override {
        return "DailyRateDecay";
    }

    std::unique_ptr<IDecayFunction> Clone() const override {
        return std::make_unique<DailyRateDecay>(daily_rate_);
    }

    float GetDailyRate() const { return daily_rate_; }

    void SetDailyRate(float daily_rate) {
        daily_rate_ = std::max(0.0f, std::min(1.0f, daily_rate));
    }

    /**
     * @brief Days until strength halves: ln(0.5) / ln(1 - r)
     */
    float GetHalfLifeDays() const {
        if (daily_rate_ == 0.0f) {
            return std::numeric_limits<float>::infinity();
        }
        if (daily_rate_ == 1.0f) {
            return 0.0f;
        }
        return std::log(0.5f) / std::log(1.0f - daily_rate_);
    }

private:
    float daily_rate_;
};

/**
 * @brief Piecewise freshness table
 *
 * Maps age onto coarse freshness categories instead of a smooth curve:
 *
 *   age < 24h        → 1.0
 *   1 day – 7 days   → 0.8
 *   7 days – 30 days → 0.5
 *   > 30 days        → 0.3
 *
 * The result is initial_strength × bracket weight. The table is
 * intentionally discontinuous at bracket edges.
 */
class FreshnessTableDecay : public IDecayFunction {
public:
    struct Bracket {
        /// Upper age bound (exclusive) for this bracket
        Timestamp::Duration max_age;
        float weight;
    };

    /// Default table
    FreshnessTableDecay()
        : FreshnessTableDecay({
              {std::chrono::hours(24), 1.0f},
              {std::chrono::hours(24 * 7), 0.8f},
              {std::chrono::hours(24 * 30), 0.5f},
          }, 0.3f) {}

    /**
     * @param brackets Brackets ordered by ascending max_age
     * @param tail_weight Weight for ages beyond the last bracket
     */
    FreshnessTableDecay(std::vector<Bracket> brackets, float tail_weight)
        : brackets_(std::move(brackets)),
          tail_weight_(std::max(0.0f, std::min(1.0f, tail_weight))) {
        std::sort(brackets_.begin(), brackets_.end(),
                  [](const Bracket& a, const Bracket& b) { return a.max_age < b.max_age; });
        for (auto& bracket : brackets_) {
            bracket.weight = std::max(0.0f, std::min(1.0f, bracket.weight));
        }
    }

    float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const override {
        if (initial_strength <= 0.0f) {
            return 0.0f;
        }
        return initial_strength * WeightForAge(elapsed_time);
    }

    const char* GetName() const override {
        return "FreshnessTableDecay";
    }

    std::unique_ptr<IDecayFunction> Clone() const override {
        return std::make_unique<FreshnessTableDecay>(brackets_, tail_weight_);
    }

    /// Bracket weight for an age; negative ages count as fresh
    float WeightForAge(Timestamp::Duration age) const {
        for (const auto& bracket : brackets_) {
            if (age < bracket.max_age) {
                return bracket.weight;
            }
        }
        return tail_weight_;
    }

    const std::vector<Bracket>& GetBrackets() const { return brackets_; }
    float GetTailWeight() const { return tail_weight_; }

private:
    std::vector<Bracket> brackets_;
    float tail_weight_;
};

/**
 * @brief Factory function to create decay functions by name
 *
 * @param name Name of decay function ("daily_rate" or "freshness_table")
 * @return Unique pointer to decay function, or nullptr if name not recognized
 */
inline std::unique_ptr<IDecayFunction> CreateDecayFunction(const std::string& name) {
    if (name == "daily_rate") {
        return std::make_unique<DailyRateDecay>();
    } else if (name == "freshness_table") {
        return std::make_unique<FreshnessTableDecay>();
    }
    return nullptr;
}

} // namespace tether
