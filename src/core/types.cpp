// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tether {

// Enum implementations

const char* ToString(ActionType type) {
    switch (type) {
        case ActionType::PARENTING_PRESENT: return "PARENTING_PRESENT";
        case ActionType::PARENTING_ABSENT: return "PARENTING_ABSENT";
        case ActionType::CONFLICT_ENGAGE: return "CONFLICT_ENGAGE";
        case ActionType::CONFLICT_AVOID: return "CONFLICT_AVOID";
        case ActionType::CONTROL_TAKING: return "CONTROL_TAKING";
        case ActionType::SUPPORTIVE_AUTONOMY: return "SUPPORTIVE_AUTONOMY";
        case ActionType::EMPATHY_SHOWN: return "EMPATHY_SHOWN";
        case ActionType::EMPATHY_LACKING: return "EMPATHY_LACKING";
        case ActionType::STRESS_ACKNOWLEDGED: return "STRESS_ACKNOWLEDGED";
        case ActionType::STRESS_DISMISSED: return "STRESS_DISMISSED";
        case ActionType::PUBLIC_SUPPORT: return "PUBLIC_SUPPORT";
        case ActionType::PUBLIC_CONTRADICTION: return "PUBLIC_CONTRADICTION";
        case ActionType::PRIVATE_CORRECTION: return "PRIVATE_CORRECTION";
        case ActionType::APOLOGY: return "APOLOGY";
        case ActionType::INITIATION_RESPONSE: return "INITIATION_RESPONSE";
        default: return "UNKNOWN";
    }
}

ActionType ParseActionType(const std::string& str) {
    if (str == "PARENTING_PRESENT") return ActionType::PARENTING_PRESENT;
    if (str == "PARENTING_ABSENT") return ActionType::PARENTING_ABSENT;
    if (str == "CONFLICT_ENGAGE") return ActionType::CONFLICT_ENGAGE;
    if (str == "CONFLICT_AVOID") return ActionType::CONFLICT_AVOID;
    if (str == "CONTROL_TAKING") return ActionType::CONTROL_TAKING;
    if (str == "SUPPORTIVE_AUTONOMY") return ActionType::SUPPORTIVE_AUTONOMY;
    if (str == "EMPATHY_SHOWN") return ActionType::EMPATHY_SHOWN;
    if (str == "EMPATHY_LACKING") return ActionType::EMPATHY_LACKING;
    if (str == "STRESS_ACKNOWLEDGED") return ActionType::STRESS_ACKNOWLEDGED;
    if (str == "STRESS_DISMISSED") return ActionType::STRESS_DISMISSED;
    if (str == "PUBLIC_SUPPORT") return ActionType::PUBLIC_SUPPORT;
    if (str == "PUBLIC_CONTRADICTION") return ActionType::PUBLIC_CONTRADICTION;
    if (str == "PRIVATE_CORRECTION") return ActionType::PRIVATE_CORRECTION;
    if (str == "APOLOGY") return ActionType::APOLOGY;
    if (str == "INITIATION_RESPONSE") return ActionType::INITIATION_RESPONSE;
    throw std::invalid_argument("Unknown ActionType: " + str);
}

const char* ToString(ContextType type) {
    switch (type) {
        case ContextType::PRIVATE: return "PRIVATE";
        case ContextType::PUBLIC: return "PUBLIC";
        default: return "UNKNOWN";
    }
}

ContextType ParseContextType(const std::string& str) {
    if (str == "PRIVATE") return ContextType::PRIVATE;
    if (str == "PUBLIC") return ContextType::PUBLIC;
    throw std::invalid_argument("Unknown ContextType: " + str);
}

const char* ToString(PatternType type) {
    switch (type) {
        case PatternType::CONSISTENT_PRESENCE: return "CONSISTENT_PRESENCE";
        case PatternType::SPORADIC_INVOLVEMENT: return "SPORADIC_INVOLVEMENT";
        case PatternType::CONFLICT_ENGAGEMENT: return "CONFLICT_ENGAGEMENT";
        case PatternType::REPEATED_AVOIDANCE: return "REPEATED_AVOIDANCE";
        case PatternType::CONTROL_TAKING: return "CONTROL_TAKING";
        case PatternType::SUPPORTIVE_AUTONOMY: return "SUPPORTIVE_AUTONOMY";
        case PatternType::EMPATHETIC_SUPPORT: return "EMPATHETIC_SUPPORT";
        case PatternType::EMOTIONAL_DISMISSAL: return "EMOTIONAL_DISMISSAL";
        case PatternType::PUBLIC_UNITY: return "PUBLIC_UNITY";
        case PatternType::PUBLIC_UNDERMINING: return "PUBLIC_UNDERMINING";
        default: return "UNKNOWN";
    }
}

PatternType ParsePatternType(const std::string& str) {
    if (str == "CONSISTENT_PRESENCE") return PatternType::CONSISTENT_PRESENCE;
    if (str == "SPORADIC_INVOLVEMENT") return PatternType::SPORADIC_INVOLVEMENT;
    if (str == "CONFLICT_ENGAGEMENT") return PatternType::CONFLICT_ENGAGEMENT;
    if (str == "REPEATED_AVOIDANCE") return PatternType::REPEATED_AVOIDANCE;
    if (str == "CONTROL_TAKING") return PatternType::CONTROL_TAKING;
    if (str == "SUPPORTIVE_AUTONOMY") return PatternType::SUPPORTIVE_AUTONOMY;
    if (str == "EMPATHETIC_SUPPORT") return PatternType::EMPATHETIC_SUPPORT;
    if (str == "EMOTIONAL_DISMISSAL") return PatternType::EMOTIONAL_DISMISSAL;
    if (str == "PUBLIC_UNITY") return PatternType::PUBLIC_UNITY;
    if (str == "PUBLIC_UNDERMINING") return PatternType::PUBLIC_UNDERMINING;
    throw std::invalid_argument("Unknown PatternType: " + str);
}

bool IsNegativePattern(PatternType type) {
    switch (type) {
        case PatternType::SPORADIC_INVOLVEMENT:
        case PatternType::REPEATED_AVOIDANCE:
        case PatternType::CONTROL_TAKING:
        case PatternType::EMOTIONAL_DISMISSAL:
        case PatternType::PUBLIC_UNDERMINING:
            return true;
        default:
            return false;
    }
}

bool PatternForAction(ActionType action, PatternType* out) {
    PatternType mapped;
    switch (action) {
        case ActionType::PARENTING_PRESENT: mapped = PatternType::CONSISTENT_PRESENCE; break;
        case ActionType::PARENTING_ABSENT: mapped = PatternType::SPORADIC_INVOLVEMENT; break;
        case ActionType::CONFLICT_ENGAGE: mapped = PatternType::CONFLICT_ENGAGEMENT; break;
        case ActionType::CONFLICT_AVOID: mapped = PatternType::REPEATED_AVOIDANCE; break;
        case ActionType::CONTROL_TAKING: mapped = PatternType::CONTROL_TAKING; break;
        case ActionType::SUPPORTIVE_AUTONOMY: mapped = PatternType::SUPPORTIVE_AUTONOMY; break;
        case ActionType::EMPATHY_SHOWN:
        case ActionType::STRESS_ACKNOWLEDGED: mapped = PatternType::EMPATHETIC_SUPPORT; break;
        case ActionType::EMPATHY_LACKING:
        case ActionType::STRESS_DISMISSED: mapped = PatternType::EMOTIONAL_DISMISSAL; break;
        case ActionType::PUBLIC_SUPPORT: mapped = PatternType::PUBLIC_UNITY; break;
        case ActionType::PUBLIC_CONTRADICTION: mapped = PatternType::PUBLIC_UNDERMINING; break;
        default:
            return false;
    }
    if (out) {
        *out = mapped;
    }
    return true;
}

const std::vector<PatternType>& AllPatternTypes() {
    static const std::vector<PatternType> kAll = {
        PatternType::CONSISTENT_PRESENCE,
        PatternType::SPORADIC_INVOLVEMENT,
        PatternType::CONFLICT_ENGAGEMENT,
        PatternType::REPEATED_AVOIDANCE,
        PatternType::CONTROL_TAKING,
        PatternType::SUPPORTIVE_AUTONOMY,
        PatternType::EMPATHETIC_SUPPORT,
        PatternType::EMOTIONAL_DISMISSAL,
        PatternType::PUBLIC_UNITY,
        PatternType::PUBLIC_UNDERMINING,
    };
    return kAll;
}

const char* ToString(EmotionType type) {
    switch (type) {
        case EmotionType::JOY: return "JOY";
        case EmotionType::SADNESS: return "SADNESS";
        case EmotionType::ANGER: return "ANGER";
        case EmotionType::FEAR: return "FEAR";
        case EmotionType::TRUST: return "TRUST";
        case EmotionType::LOVE: return "LOVE";
        case EmotionType::GUILT: return "GUILT";
        case EmotionType::PRIDE: return "PRIDE";
        case EmotionType::ANXIETY: return "ANXIETY";
        case EmotionType::FRUSTRATION: return "FRUSTRATION";
        case EmotionType::CONTENTMENT: return "CONTENTMENT";
        case EmotionType::RESENTMENT: return "RESENTMENT";
        case EmotionType::DISAPPOINTMENT: return "DISAPPOINTMENT";
        case EmotionType::CALM: return "CALM";
        default: return "UNKNOWN";
    }
}

EmotionType ParseEmotionType(const std::string& str) {
    if (str == "JOY") return EmotionType::JOY;
    if (str == "SADNESS") return EmotionType::SADNESS;
    if (str == "ANGER") return EmotionType::ANGER;
    if (str == "FEAR") return EmotionType::FEAR;
    if (str == "TRUST") return EmotionType::TRUST;
    if (str == "LOVE") return EmotionType::LOVE;
    if (str == "GUILT") return EmotionType::GUILT;
    if (str == "PRIDE") return EmotionType::PRIDE;
    if (str == "ANXIETY") return EmotionType::ANXIETY;
    if (str == "FRUSTRATION") return EmotionType::FRUSTRATION;
    if (str == "CONTENTMENT") return EmotionType::CONTENTMENT;
    if (str == "RESENTMENT") return EmotionType::RESENTMENT;
    if (str == "DISAPPOINTMENT") return EmotionType::DISAPPOINTMENT;
    if (str == "CALM") return EmotionType::CALM;
    throw std::invalid_argument("Unknown EmotionType: " + str);
}

const char* ToString(ContextCategory category) {
    switch (category) {
        case ContextCategory::SUPPORT: return "SUPPORT";
        case ContextCategory::CONFLICT: return "CONFLICT";
        case ContextCategory::PARENTING: return "PARENTING";
        case ContextCategory::INTIMACY: return "INTIMACY";
        default: return "UNKNOWN";
    }
}

ContextCategory ParseContextCategory(const std::string& str) {
    if (str == "SUPPORT") return ContextCategory::SUPPORT;
    if (str == "CONFLICT") return ContextCategory::CONFLICT;
    if (str == "PARENTING") return ContextCategory::PARENTING;
    if (str == "INTIMACY") return ContextCategory::INTIMACY;
    throw std::invalid_argument("Unknown ContextCategory: " + str);
}

ContextCategory CategoryForAction(ActionType action) {
    switch (action) {
        case ActionType::PARENTING_PRESENT:
        case ActionType::PARENTING_ABSENT:
        case ActionType::PUBLIC_SUPPORT:
        case ActionType::PUBLIC_CONTRADICTION:
            return ContextCategory::PARENTING;
        case ActionType::CONFLICT_ENGAGE:
        case ActionType::CONFLICT_AVOID:
        case ActionType::CONTROL_TAKING:
        case ActionType::PRIVATE_CORRECTION:
            return ContextCategory::CONFLICT;
        case ActionType::APOLOGY:
        case ActionType::INITIATION_RESPONSE:
            return ContextCategory::INTIMACY;
        default:
            return ContextCategory::SUPPORT;
    }
}

const char* ToString(WithdrawalLevel level) {
    switch (level) {
        case WithdrawalLevel::NONE: return "NONE";
        case WithdrawalLevel::MILD: return "MILD";
        case WithdrawalLevel::MODERATE: return "MODERATE";
        case WithdrawalLevel::SEVERE: return "SEVERE";
        default: return "UNKNOWN";
    }
}

WithdrawalLevel ParseWithdrawalLevel(const std::string& str) {
    if (str == "NONE") return WithdrawalLevel::NONE;
    if (str == "MILD") return WithdrawalLevel::MILD;
    if (str == "MODERATE") return WithdrawalLevel::MODERATE;
    if (str == "SEVERE") return WithdrawalLevel::SEVERE;
    throw std::invalid_argument("Unknown WithdrawalLevel: " + str);
}

const char* ToString(ApologyType type) {
    switch (type) {
        case ApologyType::DEFENSIVE: return "DEFENSIVE";
        case ApologyType::GENERIC: return "GENERIC";
        case ApologyType::GENUINE: return "GENUINE";
        case ApologyType::ACTION_ORIENTED: return "ACTION_ORIENTED";
        default: return "UNKNOWN";
    }
}

ApologyType ParseApologyType(const std::string& str) {
    if (str == "DEFENSIVE") return ApologyType::DEFENSIVE;
    if (str == "GENERIC") return ApologyType::GENERIC;
    if (str == "GENUINE") return ApologyType::GENUINE;
    if (str == "ACTION_ORIENTED") return ApologyType::ACTION_ORIENTED;
    throw std::invalid_argument("Unknown ApologyType: " + str);
}

// Timestamp implementations

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kSecondsPerDay = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : kDays[month - 1];
}

void CivilFromDays(int64_t z, int64_t* y, unsigned* m, unsigned* d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    *d = doy - (153 * mp + 2) / 5 + 1;
    *m = mp < 10 ? mp + 3 : mp - 9;
    *y = static_cast<int64_t>(yoe) + era * 400 + (*m <= 2);
}

} // namespace

Timestamp Timestamp::Now() {
    return Timestamp(std::chrono::time_point_cast<Duration>(ClockType::now()));
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    return Timestamp(TimePoint{Duration(micros)});
}

Timestamp Timestamp::FromIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        throw std::invalid_argument("Malformed ISO-8601 timestamp: " + text);
    }
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        throw std::invalid_argument("Out-of-range ISO-8601 timestamp: " + text);
    }

    // Optional fractional seconds, up to microsecond precision
    int64_t fraction = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                fraction = fraction * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Malformed fractional seconds: " + text);
        }
        for (; digits < 6; ++digits) {
            fraction *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Unsupported ISO-8601 suffix: " + text);
    }

    int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * kSecondsPerDay + hour * 3600 + minute * 60 + second;
    return FromMicros(seconds * kMicrosPerSecond + fraction);
}

std::string Timestamp::ToIso8601() const {
    int64_t micros = ToMicros();
    int64_t seconds = micros / kMicrosPerSecond;
    int64_t remaining_micros = micros % kMicrosPerSecond;
    if (remaining_micros < 0) {
        remaining_micros += kMicrosPerSecond;
        --seconds;
    }
    int64_t days = seconds / kSecondsPerDay;
    int64_t day_seconds = seconds % kSecondsPerDay;
    if (day_seconds < 0) {
        day_seconds += kSecondsPerDay;
        --days;
    }

    int64_t year = 0;
    unsigned month = 0, day = 0;
    CivilFromDays(days, &year, &month, &day);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day << 'T'
        << std::setw(2) << day_seconds / 3600 << ':'
        << std::setw(2) << (day_seconds % 3600) / 60 << ':'
        << std::setw(2) << day_seconds % 60 << '.'
        << std::setw(6) << remaining_micros << 'Z';
    return oss.str();
}

std::string Timestamp::ToString() const {
    return "Timestamp(" + ToIso8601() + ")";
}

double ElapsedDays(Timestamp from, Timestamp to) {
    if (to <= from) {
        return 0.0;
    }
    auto micros = (to - from).count();
    return static_cast<double>(micros) / static_cast<double>(kSecondsPerDay * kMicrosPerSecond);
}

float RoundTo2(float value) {
    return static_cast<float>(std::round(static_cast<double>(value) * 100.0) / 100.0);
}

float Clamp(float value, float lo, float hi) {
    return std::max(lo, std::min(value, hi));
}

} // namespace tether
