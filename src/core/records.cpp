// File: src/core/records.cpp
#include "core/records.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tether {

namespace {

bool InRange(float value, float lo, float hi) {
    return std::isfinite(value) && value >= lo && value <= hi;
}

} // namespace

std::string PlayerAction::GetMetadata(const std::string& key, const std::string& fallback) const {
    auto it = metadata.find(key);
    return it != metadata.end() ? it->second : fallback;
}

std::string PlayerAction::ToString() const {
    std::ostringstream oss;
    oss << "PlayerAction(" << tether::ToString(action_type)
        << ", " << tether::ToString(context)
        << ", valence=" << std::fixed << std::setprecision(2) << valence
        << ", " << timestamp.ToIso8601() << ")";
    return oss.str();
}

bool ResponseModifiers::IsValid() const {
    return InRange(response_length_multiplier, 0.3f, 1.0f) &&
           InRange(initiation_probability, 0.0f, 1.0f) &&
           InRange(cooperation_level, 0.0f, 1.0f) &&
           InRange(emotional_vulnerability, 0.0f, 1.0f) &&
           InRange(interpretation_bias, -1.0f, 1.0f);
}

std::string ResponseModifiers::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "ResponseModifiers(length=" << response_length_multiplier
        << ", initiation=" << initiation_probability
        << ", cooperation=" << cooperation_level
        << ", vulnerability=" << emotional_vulnerability
        << ", bias=" << interpretation_bias << ")";
    return oss.str();
}

std::string PersonalityState::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "PersonalityState(trust=" << trust_score
        << ", resentment=" << resentment_score
        << ", safety=" << emotional_safety
        << ", unity=" << parenting_unity
        << ", withdrawal=" << tether::ToString(withdrawal_severity)
        << ", patterns=" << recent_patterns.size() << ")";
    return oss.str();
}

} // namespace tether
