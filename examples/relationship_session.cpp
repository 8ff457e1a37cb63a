// File: examples/relationship_session.cpp
//
// One simulated week of a relationship, end to end.
// Demonstrates:
// - Loading tunables from a YAML config (or falling back to defaults)
// - Feeding tagged player actions through the ActionQueue
// - Reading PersonalityState and ResponseModifiers for the dialogue layer
// - Saving a snapshot and loading it back into a fresh manager
//
// Usage: tether_session_example [config.yaml]

#include "config/relationship_config.hpp"
#include "personality/action_queue.hpp"
#include "personality/personality_state_manager.hpp"
#include "storage/persistence_layer.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace tether;

namespace {

PlayerAction MakeAction(ActionType type, ContextType context, float valence, Timestamp when) {
    PlayerAction action;
    action.action_type = type;
    action.context = context;
    action.valence = valence;
    action.timestamp = when;
    return action;
}

void PrintState(const PersonalityStateManager& manager) {
    PersonalityState state = manager.GetCurrentState();
    ResponseModifiers modifiers = manager.GetResponseModifiers();

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  trust=" << state.trust_score
              << " resentment=" << state.resentment_score
              << " safety=" << state.emotional_safety
              << " unity=" << state.parenting_unity
              << " withdrawal=" << ToString(state.withdrawal_severity) << "\n";
    std::cout << "  " << modifiers.ToString() << "\n";

    std::cout << "  patterns:";
    for (PatternType pattern : state.recent_patterns) {
        std::cout << " " << ToString(pattern);
    }
    std::cout << "\n  emotions:";
    for (EmotionType emotion : state.dominant_emotions) {
        std::cout << " " << ToString(emotion);
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== tether Relationship Session Example ===\n\n";

    // Step 1: Configuration
    std::cout << "Step 1: Loading configuration...\n";
    RelationshipConfig config = RelationshipConfig::Default();
    if (argc > 1) {
        auto loaded = RelationshipConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load " << argv[1] << ", using defaults\n";
        } else {
            config = *loaded;
            std::cout << "  Loaded " << argv[1] << "\n";
        }
    }
    std::cout << "  Save backend: " << config.persistence.backend << "\n\n";

    PersonalityStateManager manager(config.state);
    ActionQueue queue(manager, config.queue);

    // Step 2: A week of mixed behavior
    std::cout << "Step 2: Processing a week of interactions...\n";
    const Timestamp start = Timestamp::Now() - std::chrono::hours(24 * 7);
    auto at = [&start](int day, int hour) {
        return start + std::chrono::hours(24 * day + hour);
    };

    std::vector<PlayerAction> week = {
        MakeAction(ActionType::PARENTING_PRESENT, ContextType::PRIVATE, 0.7f, at(0, 8)),
        MakeAction(ActionType::PUBLIC_SUPPORT, ContextType::PUBLIC, 0.8f, at(0, 18)),
        MakeAction(ActionType::CONTROL_TAKING, ContextType::PRIVATE, -0.5f, at(1, 9)),
        MakeAction(ActionType::STRESS_DISMISSED, ContextType::PRIVATE, -0.6f, at(1, 21)),
        MakeAction(ActionType::CONTROL_TAKING, ContextType::PRIVATE, -0.5f, at(2, 9)),
        MakeAction(ActionType::CONTROL_TAKING, ContextType::PRIVATE, -0.5f, at(3, 9)),
        MakeAction(ActionType::PUBLIC_CONTRADICTION, ContextType::PUBLIC, -0.7f, at(3, 18)),
        MakeAction(ActionType::PARENTING_PRESENT, ContextType::PRIVATE, 0.6f, at(4, 8)),
        MakeAction(ActionType::STRESS_ACKNOWLEDGED, ContextType::PRIVATE, 0.8f, at(5, 20)),
        MakeAction(ActionType::INITIATION_RESPONSE, ContextType::PRIVATE, 0.5f, at(6, 12)),
    };

    PlayerAction apology = MakeAction(ActionType::APOLOGY, ContextType::PRIVATE, 0.6f, at(4, 21));
    apology.metadata["behavior_type"] = ToString(ActionType::CONTROL_TAKING);
    apology.metadata["apology_type"] = ToString(ApologyType::GENUINE);
    week.push_back(apology);

    for (const auto& action : week) {
        if (queue.Enqueue(action) == EnqueueResult::QUEUE_FULL) {
            std::cout << "  Queue full, oldest action applied early\n";
        }
    }
    size_t applied = queue.Drain();
    std::cout << "  Applied " << applied << " actions\n";
    PrintState(manager);
    std::cout << "  Parenting consistency: "
              << manager.GetParentingConsistency(at(6, 23)) << "\n\n";

    // Step 3: Save
    std::cout << "Step 3: Saving...\n";
    std::unique_ptr<SnapshotStore> store;
    try {
        store = config.CreateStore();
    } catch (const std::runtime_error& e) {
        std::cerr << "  Cannot open save store: " << e.what() << "\n";
        return 1;
    }
    PersistenceLayer persistence(std::move(store), config.persistence.layer);

    if (persistence.Save(manager.CreateSnapshot())) {
        std::cout << "  Saved to slot " << config.persistence.layer.default_slot << "\n\n";
    } else {
        std::cout << "  Save failed, continuing without persistence\n\n";
    }

    // Step 4: Load into a fresh manager
    std::cout << "Step 4: Loading into a new session...\n";
    LoadResult loaded = persistence.Load();
    std::cout << "  Load status: " << ToString(loaded.status) << "\n";

    PersonalityStateManager restored(config.state);
    restored.RestoreSnapshot(loaded.snapshot);
    PrintState(restored);

    std::cout << "\n=== Session complete ===\n";
    return 0;
}
