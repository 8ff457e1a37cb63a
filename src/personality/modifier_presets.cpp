// File: src/personality/modifier_presets.cpp
#include "personality/modifier_presets.hpp"

namespace tether {

namespace {

// Rows: TrustBand. Columns: ResentmentBand (CALM, IRRITATED, RESENTFUL, BITTER)
const ModifierPreset kPresets[5][4] = {
    // OPEN
    {{1.0f, 1.0f, 1.0f}, {1.0f, 0.7f, 0.8f}, {0.9f, 0.4f, 0.6f}, {0.8f, 0.2f, 0.4f}},
    // STEADY
    {{1.0f, 1.0f, 0.8f}, {1.0f, 0.7f, 0.65f}, {0.9f, 0.4f, 0.5f}, {0.8f, 0.2f, 0.35f}},
    // GUARDED
    {{0.7f, 0.9f, 0.5f}, {0.7f, 0.65f, 0.4f}, {0.6f, 0.4f, 0.3f}, {0.55f, 0.2f, 0.25f}},
    // WITHDRAWN
    {{0.5f, 0.8f, 0.3f}, {0.5f, 0.6f, 0.25f}, {0.45f, 0.35f, 0.2f}, {0.4f, 0.2f, 0.15f}},
    // SHUT_DOWN
    {{0.3f, 0.7f, 0.15f}, {0.3f, 0.5f, 0.1f}, {0.3f, 0.3f, 0.1f}, {0.3f, 0.2f, 0.05f}},
};

} // namespace

const char* ToString(TrustBand band) {
    switch (band) {
        case TrustBand::OPEN:      return "OPEN";
        case TrustBand::STEADY:    return "STEADY";
        case TrustBand::GUARDED:   return "GUARDED";
        case TrustBand::WITHDRAWN: return "WITHDRAWN";
        case TrustBand::SHUT_DOWN: return "SHUT_DOWN";
    }
    return "UNKNOWN";
}

const char* ToString(ResentmentBand band) {
    switch (band) {
        case ResentmentBand::CALM:      return "CALM";
        case ResentmentBand::IRRITATED: return "IRRITATED";
        case ResentmentBand::RESENTFUL: return "RESENTFUL";
        case ResentmentBand::BITTER:    return "BITTER";
    }
    return "UNKNOWN";
}

TrustBand TrustBandFor(float trust) {
    if (trust > 70.0f) return TrustBand::OPEN;
    if (trust >= 50.0f) return TrustBand::STEADY;
    if (trust >= 40.0f) return TrustBand::GUARDED;
    if (trust >= 30.0f) return TrustBand::WITHDRAWN;
    return TrustBand::SHUT_DOWN;
}

ResentmentBand ResentmentBandFor(float resentment) {
    if (resentment < 30.0f) return ResentmentBand::CALM;
    if (resentment < 50.0f) return ResentmentBand::IRRITATED;
    if (resentment < 70.0f) return ResentmentBand::RESENTFUL;
    return ResentmentBand::BITTER;
}

const ModifierPreset& LookupPreset(TrustBand trust, ResentmentBand resentment) {
    return kPresets[static_cast<int>(trust)][static_cast<int>(resentment)];
}

} // namespace tether
