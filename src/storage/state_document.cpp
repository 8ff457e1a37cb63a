// File: src/storage/state_document.cpp
#include "storage/state_document.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace tether {

using json = nlohmann::json;

namespace {

/// Thrown while decoding when a value is present but outside its range
class ValidationFailure : public std::runtime_error {
public:
    explicit ValidationFailure(const std::string& what) : std::runtime_error(what) {}
};

const char* const kRequiredFields[] = {
    "version", "timestamp",
    "trust_score", "resentment_score", "emotional_safety", "parenting_unity",
    "patterns", "emotional_memories", "apology_effectiveness",
};

double Stored(float value) {
    return std::round(static_cast<double>(value) * 100.0) / 100.0;
}

float CheckedRange(const json& value, const std::string& name, float lo, float hi) {
    float number = value.get<float>();
    if (!std::isfinite(number) || number < lo || number > hi) {
        throw ValidationFailure(name + " out of range: " + value.dump());
    }
    return number;
}

const json& ArrayField(const json& object, const char* key) {
    const json& value = object.at(key);
    if (!value.is_array()) {
        throw ValidationFailure(std::string("'") + key + "' must be an array");
    }
    return value;
}

const json& ObjectField(const json& object, const char* key) {
    const json& value = object.at(key);
    if (!value.is_object()) {
        throw ValidationFailure(std::string("'") + key + "' must be an object");
    }
    return value;
}

/// Optional non-negative counter; absent means zero
uint32_t OptionalCount(const json& object, const char* key) {
    if (!object.contains(key)) {
        return 0;
    }
    const json& value = object.at(key);
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw ValidationFailure(std::string("'") + key + "' must be a non-negative count: " + value.dump());
    }
    return value.get<uint32_t>();
}

Timestamp ReadTime(const json& value) {
    return Timestamp::FromIso8601(value.get<std::string>());
}

json OptionalTime(const std::optional<Timestamp>& time) {
    return time ? json(time->ToIso8601()) : json(nullptr);
}

// ============================================================================
// Encoding
// ============================================================================

json EncodeAction(const PlayerAction& action) {
    return json{
        {"action_type", ToString(action.action_type)},
        {"context", ToString(action.context)},
        {"valence", Stored(action.valence)},
        {"timestamp", action.timestamp.ToIso8601()},
        {"metadata", action.metadata},
    };
}

json EncodePattern(const BehaviorPattern& pattern) {
    json occurrences = json::array();
    for (const auto& occurrence : pattern.occurrences) {
        if (occurrence) {
            occurrences.push_back(EncodeAction(*occurrence));
        }
    }
    return json{
        {"pattern_type", ToString(pattern.pattern_type)},
        {"occurrences", occurrences},
        {"frequency", Stored(pattern.frequency)},
        {"weight", Stored(pattern.weight)},
        {"first_seen", pattern.first_seen.ToIso8601()},
        {"last_seen", pattern.last_seen.ToIso8601()},
    };
}

json EncodeMemory(const EmotionalMemory& memory) {
    json patterns = json::array();
    for (PatternType type : memory.associated_patterns) {
        patterns.push_back(ToString(type));
    }
    const EmotionalImpact& impact = memory.emotional_impact;
    return json{
        {"interaction_id", memory.interaction_id},
        {"emotional_impact", {
            {"primary_emotion", ToString(impact.primary_emotion)},
            {"intensity", Stored(impact.intensity)},
            {"valence", Stored(impact.valence)},
            {"context_category", ToString(impact.context_category)},
        }},
        {"timestamp", memory.timestamp.ToIso8601()},
        {"context", ToString(memory.context)},
        {"weight", Stored(memory.weight)},
        {"associated_patterns", patterns},
        {"flagged_unreliable", memory.flagged_unreliable},
    };
}

json EncodeApology(const ApologyRecord& record) {
    return json{
        {"effectiveness", Stored(record.effectiveness)},
        {"last_apology", OptionalTime(record.last_apology)},
        {"last_recurrence", OptionalTime(record.last_recurrence)},
        {"last_apology_type", record.last_apology_type
                                  ? json(ToString(*record.last_apology_type))
                                  : json(nullptr)},
        {"recurrence_count", record.recurrence_count},
    };
}

// ============================================================================
// Decoding
// ============================================================================

PlayerAction DecodeAction(const json& value) {
    PlayerAction action;
    action.action_type = ParseActionType(value.at("action_type").get<std::string>());
    action.context = ParseContextType(value.at("context").get<std::string>());
    action.valence = CheckedRange(value.at("valence"), "action valence", -1.0f, 1.0f);
    action.timestamp = ReadTime(value.at("timestamp"));
    if (value.contains("metadata")) {
        action.metadata = value.at("metadata").get<std::map<std::string, std::string>>();
    }
    return action;
}

BehaviorPattern DecodePattern(const json& value) {
    BehaviorPattern pattern;
    pattern.pattern_type = ParsePatternType(value.at("pattern_type").get<std::string>());
    for (const auto& occurrence : ArrayField(value, "occurrences")) {
        pattern.occurrences.push_back(std::make_shared<const PlayerAction>(DecodeAction(occurrence)));
    }
    pattern.frequency = value.at("frequency").get<float>();
    if (!std::isfinite(pattern.frequency) || pattern.frequency < 0.0f) {
        throw ValidationFailure("pattern frequency out of range");
    }
    pattern.weight = CheckedRange(value.at("weight"), "pattern weight", 0.0f, 1.0f);
    pattern.first_seen = ReadTime(value.at("first_seen"));
    pattern.last_seen = ReadTime(value.at("last_seen"));
    return pattern;
}

EmotionalMemory DecodeMemory(const json& value) {
    EmotionalMemory memory;
    memory.interaction_id = value.value("interaction_id", "");

    const json& impact = value.at("emotional_impact");
    memory.emotional_impact.primary_emotion =
        ParseEmotionType(impact.at("primary_emotion").get<std::string>());
    memory.emotional_impact.intensity =
        CheckedRange(impact.at("intensity"), "memory intensity", 0.0f, 1.0f);
    memory.emotional_impact.valence =
        CheckedRange(impact.at("valence"), "memory valence", -1.0f, 1.0f);
    memory.emotional_impact.context_category =
        ParseContextCategory(impact.at("context_category").get<std::string>());

    memory.timestamp = ReadTime(value.at("timestamp"));
    memory.context = ParseContextType(value.at("context").get<std::string>());
    memory.weight = CheckedRange(value.at("weight"), "memory weight", 0.0f, 1.0f);
    for (const auto& pattern : ArrayField(value, "associated_patterns")) {
        memory.associated_patterns.insert(ParsePatternType(pattern.get<std::string>()));
    }
    memory.flagged_unreliable = value.value("flagged_unreliable", false);
    return memory;
}

ApologyRecord DecodeApology(const json& value) {
    ApologyRecord record;
    record.effectiveness = CheckedRange(value.at("effectiveness"), "apology effectiveness", 0.1f, 1.0f);

    if (value.contains("last_apology") && !value.at("last_apology").is_null()) {
        record.last_apology = ReadTime(value.at("last_apology"));
    }
    if (value.contains("last_recurrence") && !value.at("last_recurrence").is_null()) {
        record.last_recurrence = ReadTime(value.at("last_recurrence"));
    }
    if (value.contains("last_apology_type") && !value.at("last_apology_type").is_null()) {
        record.last_apology_type = ParseApologyType(value.at("last_apology_type").get<std::string>());
    }
    record.recurrence_count = OptionalCount(value, "recurrence_count");
    return record;
}

RelationshipSnapshot DecodeSnapshot(const json& document) {
    if (!document.is_object()) {
        throw ValidationFailure("document is not an object");
    }
    for (const char* field : kRequiredFields) {
        if (!document.contains(field)) {
            throw ValidationFailure(std::string("missing required field '") + field + "'");
        }
    }

    std::string version = document.at("version").get<std::string>();
    if (version != kDocumentVersion) {
        throw ValidationFailure("unsupported document version " + version);
    }

    RelationshipSnapshot snapshot;
    snapshot.timestamp = ReadTime(document.at("timestamp"));
    snapshot.trust_score = CheckedRange(document.at("trust_score"), "trust_score", 0.0f, 100.0f);
    snapshot.resentment_score = CheckedRange(document.at("resentment_score"), "resentment_score", 0.0f, 100.0f);
    snapshot.emotional_safety = CheckedRange(document.at("emotional_safety"), "emotional_safety", 0.0f, 100.0f);
    snapshot.parenting_unity = CheckedRange(document.at("parenting_unity"), "parenting_unity", 0.0f, 100.0f);

    for (const auto& pattern : ArrayField(document, "patterns")) {
        snapshot.patterns.push_back(DecodePattern(pattern));
    }
    for (const auto& memory : ArrayField(document, "emotional_memories")) {
        snapshot.emotional_memories.push_back(DecodeMemory(memory));
    }
    for (const auto& [behavior, record] : ObjectField(document, "apology_effectiveness").items()) {
        snapshot.apology_effectiveness[behavior] = DecodeApology(record);
    }

    if (document.contains("action_history")) {
        for (const auto& action : ArrayField(document, "action_history")) {
            snapshot.action_history.push_back(DecodeAction(action));
        }
    }
    if (document.contains("broken_patterns")) {
        for (const auto& [type, time] : ObjectField(document, "broken_patterns").items()) {
            snapshot.broken_patterns[ParsePatternType(type)] = ReadTime(time);
        }
    }
    snapshot.trust_positive_streak = OptionalCount(document, "trust_positive_streak");
    snapshot.initiation_streak = OptionalCount(document, "initiation_streak");

    return snapshot;
}

} // namespace

const char* ToString(LoadStatus status) {
    switch (status) {
        case LoadStatus::OK:               return "OK";
        case LoadStatus::NOT_FOUND:        return "NOT_FOUND";
        case LoadStatus::IO_FAILURE:       return "IO_FAILURE";
        case LoadStatus::PARSE_ERROR:      return "PARSE_ERROR";
        case LoadStatus::VALIDATION_ERROR: return "VALIDATION_ERROR";
    }
    return "UNKNOWN";
}

json EncodeDocument(const RelationshipSnapshot& snapshot) {
    json document;
    document["version"] = kDocumentVersion;
    document["timestamp"] = snapshot.timestamp.ToIso8601();
    document["trust_score"] = Stored(snapshot.trust_score);
    document["resentment_score"] = Stored(snapshot.resentment_score);
    document["emotional_safety"] = Stored(snapshot.emotional_safety);
    document["parenting_unity"] = Stored(snapshot.parenting_unity);

    document["patterns"] = json::array();
    for (const auto& pattern : snapshot.patterns) {
        document["patterns"].push_back(EncodePattern(pattern));
    }

    document["emotional_memories"] = json::array();
    for (const auto& memory : snapshot.emotional_memories) {
        document["emotional_memories"].push_back(EncodeMemory(memory));
    }

    document["apology_effectiveness"] = json::object();
    for (const auto& [behavior, record] : snapshot.apology_effectiveness) {
        document["apology_effectiveness"][behavior] = EncodeApology(record);
    }

    document["action_history"] = json::array();
    for (const auto& action : snapshot.action_history) {
        document["action_history"].push_back(EncodeAction(action));
    }

    document["broken_patterns"] = json::object();
    for (const auto& [type, time] : snapshot.broken_patterns) {
        document["broken_patterns"][ToString(type)] = time.ToIso8601();
    }

    document["trust_positive_streak"] = snapshot.trust_positive_streak;
    document["initiation_streak"] = snapshot.initiation_streak;

    return document;
}

DecodeResult DecodeDocument(const json& document) {
    DecodeResult result;
    try {
        result.snapshot = DecodeSnapshot(document);
        result.status = LoadStatus::OK;
    } catch (const ValidationFailure& e) {
        result.status = LoadStatus::VALIDATION_ERROR;
        result.error = e.what();
    } catch (const json::exception& e) {
        result.status = LoadStatus::PARSE_ERROR;
        result.error = e.what();
    } catch (const std::invalid_argument& e) {
        result.status = LoadStatus::PARSE_ERROR;
        result.error = e.what();
    }
    return result;
}

DecodeResult DecodeDocumentText(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        DecodeResult result;
        result.status = LoadStatus::PARSE_ERROR;
        result.error = e.what();
        return result;
    }
    return DecodeDocument(document);
}

} // namespace tether
