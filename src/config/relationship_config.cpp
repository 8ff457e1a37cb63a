// File: src/config/relationship_config.cpp
//
// YAML Configuration Implementation for tether

#include "config/relationship_config.hpp"
#include "storage/file_snapshot_store.hpp"
#include "storage/sqlite_snapshot_store.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace tether {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static Timestamp::Duration DaysToDuration(float days) {
    return std::chrono::duration_cast<Timestamp::Duration>(
        std::chrono::duration<double, std::ratio<86400>>(days));
}

static Timestamp::Duration MinutesToDuration(float minutes) {
    return std::chrono::duration_cast<Timestamp::Duration>(
        std::chrono::duration<double, std::ratio<60>>(minutes));
}

static double DurationToDays(Timestamp::Duration duration) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<86400>>>(duration).count();
}

static double DurationToMinutes(Timestamp::Duration duration) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<60>>>(duration).count();
}

static const char* Bool(bool value) {
    return value ? "true" : "false";
}

// ============================================================================
// Section setters; return false for unknown keys
// ============================================================================

static bool ApplyPatterns(PatternTracker::Config& c, const std::string& key, const std::string& value) {
    if (key == "time_window_days") c.time_window = DaysToDuration(std::stof(value));
    else if (key == "min_occurrences") c.min_occurrences = static_cast<uint32_t>(std::stoul(value));
    else if (key == "daily_decay_rate") c.daily_decay_rate = std::stof(value);
    else if (key == "break_threshold") c.break_threshold = static_cast<uint32_t>(std::stoul(value));
    else if (key == "opposing_valence_threshold") c.opposing_valence_threshold = std::stof(value);
    else if (key == "removal_threshold") c.removal_threshold = std::stof(value);
    else if (key == "debug_logging") c.debug_logging = ParseBool(value);
    else return false;
    return true;
}

static bool ApplyMemory(EmotionalMemorySystem::Config& c, const std::string& key, const std::string& value) {
    if (key == "max_memories") c.max_memories = std::stoul(value);
    else if (key == "protected_weight") c.protected_weight = std::stof(value);
    else if (key == "debug_logging") c.debug_logging = ParseBool(value);
    else return false;
    return true;
}

static bool ApplyTrust(TrustDynamicsEngine::Config& c, const std::string& key, const std::string& value) {
    if (key == "initial_trust") c.initial_trust = std::stof(value);
    else if (key == "initial_resentment") c.initial_resentment = std::stof(value);
    else if (key == "positive_rate") c.positive_rate = std::stof(value);
    else if (key == "negative_rate") c.negative_rate = std::stof(value);
    else if (key == "public_multiplier") c.public_multiplier = std::stof(value);
    else if (key == "diminishing_window_minutes") c.diminishing_window = MinutesToDuration(std::stof(value));
    else if (key == "diminishing_cap") c.diminishing_cap = std::stof(value);
    else if (key == "resilience_threshold") c.resilience_threshold = std::stof(value);
    else if (key == "resilience_factor") c.resilience_factor = std::stof(value);
    else if (key == "dampening_threshold") c.dampening_threshold = std::stof(value);
    else if (key == "dampening_factor") c.dampening_factor = std::stof(value);
    else if (key == "pattern_resentment_rate") c.pattern_resentment_rate = std::stof(value);
    else if (key == "isolated_resentment_rate") c.isolated_resentment_rate = std::stof(value);
    else if (key == "resentment_daily_decay") c.resentment_daily_decay = std::stof(value);
    else if (key == "decay_streak_required") c.decay_streak_required = static_cast<uint32_t>(std::stoul(value));
    else if (key == "withdrawal_threshold") c.withdrawal_threshold = std::stof(value);
    else if (key == "withdrawal_exit_threshold") c.withdrawal_exit_threshold = std::stof(value);
    else if (key == "mild_floor") c.mild_floor = std::stof(value);
    else if (key == "moderate_floor") c.moderate_floor = std::stof(value);
    else if (key == "apology_recurrence_penalty") c.apology_recurrence_penalty = std::stof(value);
    else if (key == "apology_floor") c.apology_floor = std::stof(value);
    else if (key == "apology_weekly_recovery") c.apology_weekly_recovery = std::stof(value);
    else if (key == "debug_logging") c.debug_logging = ParseBool(value);
    else return false;
    return true;
}

static bool ApplyState(PersonalityStateManager::Config& c, const std::string& key, const std::string& value) {
    if (key == "initial_emotional_safety") c.initial_emotional_safety = std::stof(value);
    else if (key == "initial_parenting_unity") c.initial_parenting_unity = std::stof(value);
    else if (key == "acknowledgment_rate") c.acknowledgment_rate = std::stof(value);
    else if (key == "dismissal_rate") c.dismissal_rate = std::stof(value);
    else if (key == "safety_buffer_threshold") c.safety_buffer_threshold = std::stof(value);
    else if (key == "safety_buffer_factor") c.safety_buffer_factor = std::stof(value);
    else if (key == "unity_rate") c.unity_rate = std::stof(value);
    else if (key == "engagement_relief") c.engagement_relief = std::stof(value);
    else if (key == "avoidance_relief") c.avoidance_relief = std::stof(value);
    else if (key == "sub_pattern_window_days") c.sub_pattern_window = DaysToDuration(std::stof(value));
    else if (key == "sub_pattern_threshold") c.sub_pattern_threshold = static_cast<uint32_t>(std::stoul(value));
    else if (key == "pattern_trust_multiplier") c.pattern_trust_multiplier = std::stof(value);
    else if (key == "cooperation_penalty_rate") c.cooperation_penalty_rate = std::stof(value);
    else if (key == "max_cooperation_penalty") c.max_cooperation_penalty = std::stof(value);
    else if (key == "initiation_baseline") c.initiation_baseline = std::stof(value);
    else if (key == "initiation_minimum") c.initiation_minimum = std::stof(value);
    else if (key == "initiation_boost") c.initiation_boost = std::stof(value);
    else if (key == "initiation_streak_required") c.initiation_streak_required = static_cast<uint32_t>(std::stoul(value));
    else if (key == "recovery_step") c.recovery_step = std::stof(value);
    else if (key == "apology_trust_repair") c.apology_trust_repair = std::stof(value);
    else if (key == "apology_resentment_relief") c.apology_resentment_relief = std::stof(value);
    else if (key == "dominant_emotion_count") c.dominant_emotion_count = std::stoul(value);
    else if (key == "debug_logging") c.debug_logging = ParseBool(value);
    else return false;
    return true;
}

static bool ApplyValue(RelationshipConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "patterns") {
        return ApplyPatterns(config.state.patterns, key, value);
    }
    if (section == "memory") {
        return ApplyMemory(config.state.memory, key, value);
    }
    if (section == "trust") {
        return ApplyTrust(config.state.trust, key, value);
    }
    if (section == "state") {
        return ApplyState(config.state, key, value);
    }
    if (section == "queue") {
        if (key == "max_depth") config.queue.max_depth = std::stoul(value);
        else if (key == "debug_logging") config.queue.debug_logging = ParseBool(value);
        else return false;
        return true;
    }
    if (section == "persistence") {
        if (key == "backend") config.persistence.backend = value;
        else if (key == "directory") config.persistence.directory = value;
        else if (key == "database_path") config.persistence.database_path = value;
        else if (key == "default_slot") config.persistence.layer.default_slot = value;
        else if (key == "save_attempts") config.persistence.layer.save_attempts = static_cast<uint32_t>(std::stoul(value));
        else if (key == "pretty_print") config.persistence.layer.pretty_print = ParseBool(value);
        else if (key == "debug_logging") config.persistence.layer.debug_logging = ParseBool(value);
        else return false;
        return true;
    }
    return false;
}

// ============================================================================
// Loading
// ============================================================================

std::optional<RelationshipConfig> RelationshipConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<RelationshipConfig> RelationshipConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    RelationshipConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error at line " << parser.problem_mark.line + 1
                      << ": " << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        bool known = false;
                        try {
                            known = ApplyValue(config, current_section, current_key, value);
                        } catch (const std::invalid_argument&) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        } catch (const std::out_of_range&) {
                            std::cerr << "Value out of range for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }

                        if (!known) {
                            std::cerr << "Ignoring unknown config key " << current_section
                                      << "." << current_key << std::endl;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

// ============================================================================
// Saving
// ============================================================================

bool RelationshipConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string RelationshipConfig::ToYamlString() const {
    std::ostringstream ss;
    const auto& p = state.patterns;
    const auto& m = state.memory;
    const auto& t = state.trust;
    const auto& s = state;

    ss << "# tether relationship configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "patterns:\n";
    ss << "  time_window_days: " << DurationToDays(p.time_window) << "\n";
    ss << "  min_occurrences: " << p.min_occurrences << "\n";
    ss << "  daily_decay_rate: " << p.daily_decay_rate << "\n";
    ss << "  break_threshold: " << p.break_threshold << "\n";
    ss << "  opposing_valence_threshold: " << p.opposing_valence_threshold << "\n";
    ss << "  removal_threshold: " << p.removal_threshold << "\n";
    ss << "  debug_logging: " << Bool(p.debug_logging) << "\n\n";

    ss << "memory:\n";
    ss << "  max_memories: " << m.max_memories << "\n";
    ss << "  protected_weight: " << m.protected_weight << "\n";
    ss << "  debug_logging: " << Bool(m.debug_logging) << "\n\n";

    ss << "trust:\n";
    ss << "  initial_trust: " << t.initial_trust << "\n";
    ss << "  initial_resentment: " << t.initial_resentment << "\n";
    ss << "  positive_rate: " << t.positive_rate << "\n";
    ss << "  negative_rate: " << t.negative_rate << "\n";
    ss << "  public_multiplier: " << t.public_multiplier << "\n";
    ss << "  diminishing_window_minutes: " << DurationToMinutes(t.diminishing_window) << "\n";
    ss << "  diminishing_cap: " << t.diminishing_cap << "\n";
    ss << "  resilience_threshold: " << t.resilience_threshold << "\n";
    ss << "  resilience_factor: " << t.resilience_factor << "\n";
    ss << "  dampening_threshold: " << t.dampening_threshold << "\n";
    ss << "  dampening_factor: " << t.dampening_factor << "\n";
    ss << "  pattern_resentment_rate: " << t.pattern_resentment_rate << "\n";
    ss << "  isolated_resentment_rate: " << t.isolated_resentment_rate << "\n";
    ss << "  resentment_daily_decay: " << t.resentment_daily_decay << "\n";
    ss << "  decay_streak_required: " << t.decay_streak_required << "\n";
    ss << "  withdrawal_threshold: " << t.withdrawal_threshold << "\n";
    ss << "  withdrawal_exit_threshold: " << t.withdrawal_exit_threshold << "\n";
    ss << "  mild_floor: " << t.mild_floor << "\n";
    ss << "  moderate_floor: " << t.moderate_floor << "\n";
    ss << "  apology_recurrence_penalty: " << t.apology_recurrence_penalty << "\n";
    ss << "  apology_floor: " << t.apology_floor << "\n";
    ss << "  apology_weekly_recovery: " << t.apology_weekly_recovery << "\n";
    ss << "  debug_logging: " << Bool(t.debug_logging) << "\n\n";

    ss << "state:\n";
    ss << "  initial_emotional_safety: " << s.initial_emotional_safety << "\n";
    ss << "  initial_parenting_unity: " << s.initial_parenting_unity << "\n";
    ss << "  acknowledgment_rate: " << s.acknowledgment_rate << "\n";
    ss << "  dismissal_rate: " << s.dismissal_rate << "\n";
    ss << "  safety_buffer_threshold: " << s.safety_buffer_threshold << "\n";
    ss << "  safety_buffer_factor: " << s.safety_buffer_factor << "\n";
    ss << "  unity_rate: " << s.unity_rate << "\n";
    ss << "  engagement_relief: " << s.engagement_relief << "\n";
    ss << "  avoidance_relief: " << s.avoidance_relief << "\n";
    ss << "  sub_pattern_window_days: " << DurationToDays(s.sub_pattern_window) << "\n";
    ss << "  sub_pattern_threshold: " << s.sub_pattern_threshold << "\n";
    ss << "  pattern_trust_multiplier: " << s.pattern_trust_multiplier << "\n";
    ss << "  cooperation_penalty_rate: " << s.cooperation_penalty_rate << "\n";
    ss << "  max_cooperation_penalty: " << s.max_cooperation_penalty << "\n";
    ss << "  initiation_baseline: " << s.initiation_baseline << "\n";
    ss << "  initiation_minimum: " << s.initiation_minimum << "\n";
    ss << "  initiation_boost: " << s.initiation_boost << "\n";
    ss << "  initiation_streak_required: " << s.initiation_streak_required << "\n";
    ss << "  recovery_step: " << s.recovery_step << "\n";
    ss << "  apology_trust_repair: " << s.apology_trust_repair << "\n";
    ss << "  apology_resentment_relief: " << s.apology_resentment_relief << "\n";
    ss << "  dominant_emotion_count: " << s.dominant_emotion_count << "\n";
    ss << "  debug_logging: " << Bool(s.debug_logging) << "\n\n";

    ss << "queue:\n";
    ss << "  max_depth: " << queue.max_depth << "\n";
    ss << "  debug_logging: " << Bool(queue.debug_logging) << "\n\n";

    ss << "persistence:\n";
    ss << "  backend: \"" << persistence.backend << "\"\n";
    ss << "  directory: \"" << persistence.directory << "\"\n";
    ss << "  database_path: \"" << persistence.database_path << "\"\n";
    ss << "  default_slot: \"" << persistence.layer.default_slot << "\"\n";
    ss << "  save_attempts: " << persistence.layer.save_attempts << "\n";
    ss << "  pretty_print: " << Bool(persistence.layer.pretty_print) << "\n";
    ss << "  debug_logging: " << Bool(persistence.layer.debug_logging) << "\n";

    return ss.str();
}

// ============================================================================
// Validation
// ============================================================================

bool RelationshipConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> RelationshipConfig::GetValidationErrors() const {
    std::vector<std::string> errors;
    const auto& p = state.patterns;
    const auto& t = state.trust;

    // Patterns
    if (p.time_window.count() <= 0) {
        errors.push_back("patterns.time_window_days must be greater than 0");
    }
    if (p.min_occurrences == 0) {
        errors.push_back("patterns.min_occurrences must be greater than 0");
    }
    if (p.daily_decay_rate < 0.0f || p.daily_decay_rate > 1.0f) {
        errors.push_back("patterns.daily_decay_rate must be between 0.0 and 1.0");
    }
    if (p.break_threshold == 0) {
        errors.push_back("patterns.break_threshold must be greater than 0");
    }
    if (!p.IsValid() && errors.empty()) {
        errors.push_back("patterns section is invalid");
    }

    // Memory
    if (state.memory.max_memories == 0) {
        errors.push_back("memory.max_memories must be greater than 0");
    }
    if (state.memory.protected_weight < 0.0f || state.memory.protected_weight > 1.0f) {
        errors.push_back("memory.protected_weight must be between 0.0 and 1.0");
    }

    // Trust
    if (t.initial_trust < 0.0f || t.initial_trust > 100.0f) {
        errors.push_back("trust.initial_trust must be between 0 and 100");
    }
    if (t.initial_resentment < 0.0f || t.initial_resentment > 100.0f) {
        errors.push_back("trust.initial_resentment must be between 0 and 100");
    }
    if (t.positive_rate <= 0.0f || t.negative_rate <= 0.0f) {
        errors.push_back("trust rates must be greater than 0");
    }
    if (t.withdrawal_exit_threshold < t.withdrawal_threshold) {
        errors.push_back("trust.withdrawal_exit_threshold must be >= withdrawal_threshold");
    }
    if (t.apology_floor < 0.0f || t.apology_floor > 1.0f) {
        errors.push_back("trust.apology_floor must be between 0.0 and 1.0");
    }
    if (!t.IsValid() && errors.empty()) {
        errors.push_back("trust section is invalid");
    }

    // State
    if (state.recovery_step <= 0.0f || state.recovery_step > 1.0f) {
        errors.push_back("state.recovery_step must be in (0.0, 1.0]");
    }
    if (state.initiation_minimum > state.initiation_baseline) {
        errors.push_back("state.initiation_minimum must be <= initiation_baseline");
    }
    if (!state.IsValid() && errors.empty()) {
        errors.push_back("state section is invalid");
    }

    // Queue
    if (queue.max_depth == 0) {
        errors.push_back("queue.max_depth must be greater than 0");
    }

    // Persistence
    if (persistence.backend != "file" && persistence.backend != "sqlite") {
        errors.push_back("persistence.backend must be one of: file, sqlite");
    }
    if (!IsValidSlotName(persistence.layer.default_slot)) {
        errors.push_back("persistence.default_slot must be 1-64 characters of [A-Za-z0-9_-]");
    }
    if (persistence.layer.save_attempts == 0) {
        errors.push_back("persistence.save_attempts must be greater than 0");
    }

    return errors;
}

std::unique_ptr<SnapshotStore> RelationshipConfig::CreateStore() const {
    if (persistence.backend == "sqlite") {
        SqliteSnapshotStore::Config store_config;
        store_config.db_path = persistence.database_path;
        return std::make_unique<SqliteSnapshotStore>(store_config);
    }
    return std::make_unique<FileSnapshotStore>(persistence.directory);
}

RelationshipConfig RelationshipConfig::Default() {
    return RelationshipConfig{};  // Uses default member initializers
}

} // namespace tether
