// File: src/personality/modifier_presets.hpp
#pragma once

#include <cstdint>

namespace tether {

// TrustBand: Coarse trust level used to select response presets
enum class TrustBand : uint8_t {
    OPEN = 0,       // trust > 70
    STEADY = 1,     // 50 - 70
    GUARDED = 2,    // 40 - 50
    WITHDRAWN = 3,  // 30 - 40
    SHUT_DOWN = 4,  // below 30
};

// ResentmentBand: Coarse resentment level used to select response presets
enum class ResentmentBand : uint8_t {
    CALM = 0,       // below 30
    IRRITATED = 1,  // 30 - 50
    RESENTFUL = 2,  // 50 - 70
    BITTER = 3,     // 70 and above
};

const char* ToString(TrustBand band);
const char* ToString(ResentmentBand band);

TrustBand TrustBandFor(float trust);
ResentmentBand ResentmentBandFor(float resentment);

/// Baseline engagement values for one (trust band, resentment band) cell
struct ModifierPreset {
    float response_length;
    float cooperation;
    /// Scaled by emotional safety to produce emotional_vulnerability
    float vulnerability_scale;
};

/// Preset lookup; every band combination has an entry
const ModifierPreset& LookupPreset(TrustBand trust, ResentmentBand resentment);

} // namespace tether
