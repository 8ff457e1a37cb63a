// File: src/core/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tether {

// ActionType: Discrete player behaviors produced by the scenario layer
enum class ActionType : uint8_t {
    PARENTING_PRESENT = 0,      // Showed up for a parenting moment
    PARENTING_ABSENT = 1,       // Missed a parenting moment
    CONFLICT_ENGAGE = 2,        // Engaged with a disagreement
    CONFLICT_AVOID = 3,         // Dodged a disagreement
    CONTROL_TAKING = 4,         // Took a decision away from the partner
    SUPPORTIVE_AUTONOMY = 5,    // Left room for the partner's own decision
    EMPATHY_SHOWN = 6,
    EMPATHY_LACKING = 7,
    STRESS_ACKNOWLEDGED = 8,    // Acknowledged shared stress
    STRESS_DISMISSED = 9,       // Dismissed the partner's stress
    PUBLIC_SUPPORT = 10,        // Backed the partner in front of the child
    PUBLIC_CONTRADICTION = 11,  // Contradicted the partner in front of the child
    PRIVATE_CORRECTION = 12,    // Raised a disagreement away from the child
    APOLOGY = 13,
    INITIATION_RESPONSE = 14,   // Response to contact the AI initiated
};

// Convert ActionType to string
const char* ToString(ActionType type);

// Parse ActionType from string
ActionType ParseActionType(const std::string& str);

// ContextType: Whether an interaction happened in front of the child
enum class ContextType : uint8_t {
    PRIVATE = 0,
    PUBLIC = 1,
};

const char* ToString(ContextType type);
ContextType ParseContextType(const std::string& str);

// PatternType: Recurring behavior signatures
enum class PatternType : uint8_t {
    CONSISTENT_PRESENCE = 0,
    SPORADIC_INVOLVEMENT = 1,
    CONFLICT_ENGAGEMENT = 2,
    REPEATED_AVOIDANCE = 3,
    CONTROL_TAKING = 4,
    SUPPORTIVE_AUTONOMY = 5,
    EMPATHETIC_SUPPORT = 6,
    EMOTIONAL_DISMISSAL = 7,
    PUBLIC_UNITY = 8,
    PUBLIC_UNDERMINING = 9,
};

const char* ToString(PatternType type);
PatternType ParsePatternType(const std::string& str);

// True for patterns that erode the relationship and can be broken
bool IsNegativePattern(PatternType type);

// Map an action onto its pattern signature.
// Returns false for actions that never form patterns (apologies, corrections, ...)
bool PatternForAction(ActionType action, PatternType* out);

// All pattern types, in enum order
const std::vector<PatternType>& AllPatternTypes();

// EmotionType: Primary emotion carried by an emotional memory
enum class EmotionType : uint8_t {
    JOY = 0,
    SADNESS = 1,
    ANGER = 2,
    FEAR = 3,
    TRUST = 4,
    LOVE = 5,
    GUILT = 6,
    PRIDE = 7,
    ANXIETY = 8,
    FRUSTRATION = 9,
    CONTENTMENT = 10,
    RESENTMENT = 11,
    DISAPPOINTMENT = 12,
    CALM = 13,
};

const char* ToString(EmotionType type);
EmotionType ParseEmotionType(const std::string& str);

// ContextCategory: What an interaction was about
enum class ContextCategory : uint8_t {
    SUPPORT = 0,
    CONFLICT = 1,
    PARENTING = 2,
    INTIMACY = 3,
};

const char* ToString(ContextCategory category);
ContextCategory ParseContextCategory(const std::string& str);

// Category an action type is filed under
ContextCategory CategoryForAction(ActionType action);

// WithdrawalLevel: Severity of the withdrawn behavioral mode
enum class WithdrawalLevel : uint8_t {
    NONE = 0,
    MILD = 1,       // trust in [40, 50)
    MODERATE = 2,   // trust in [30, 40)
    SEVERE = 3,     // trust below 30
};

const char* ToString(WithdrawalLevel level);
WithdrawalLevel ParseWithdrawalLevel(const std::string& str);

// ApologyType: How an apology was phrased
enum class ApologyType : uint8_t {
    DEFENSIVE = 0,
    GENERIC = 1,
    GENUINE = 2,          // Genuine, with acknowledgment
    ACTION_ORIENTED = 3,  // Action-oriented, with a plan
};

const char* ToString(ApologyType type);
ApologyType ParseApologyType(const std::string& str);

// Timestamp: Microsecond-precision wall-clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using Duration = std::chrono::microseconds;
    using TimePoint = std::chrono::time_point<ClockType, Duration>;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Parse "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]" (UTC)
    // @throws std::invalid_argument on malformed input
    static Timestamp FromIso8601(const std::string& text);

    // Default constructor creates the epoch
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const { return time_point_.time_since_epoch().count(); }

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return time_point_ - other.time_point_;
    }

    // Shift by a duration
    template <typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ + std::chrono::duration_cast<Duration>(d));
    }

    template <typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ - std::chrono::duration_cast<Duration>(d));
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // ISO-8601 UTC with microseconds, e.g. 2024-03-01T08:15:00.000000Z
    std::string ToIso8601() const;

    // String conversion for debugging
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Elapsed time expressed in (fractional) days; negative spans yield 0
double ElapsedDays(Timestamp from, Timestamp to);

// Round to two decimal places
float RoundTo2(float value);

// Clamp into [lo, hi]
float Clamp(float value, float lo, float hi);

} // namespace tether
