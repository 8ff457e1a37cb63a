// File: tests/integration/relationship_integration_test.cpp
//
// End-to-end flows: queue → manager → persistence → restore

#include "config/relationship_config.hpp"
#include "personality/action_queue.hpp"
#include "personality/personality_state_manager.hpp"
#include "storage/file_snapshot_store.hpp"
#include "storage/persistence_layer.hpp"
#include "storage/sqlite_snapshot_store.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <unistd.h>

using namespace tether;
namespace fs = std::filesystem;

namespace {

constexpr auto kHour = std::chrono::hours(1);
constexpr auto kDay = std::chrono::hours(24);

PlayerAction Make(ActionType type, float valence, Timestamp when,
                  ContextType context = ContextType::PRIVATE) {
    PlayerAction action;
    action.action_type = type;
    action.valence = valence;
    action.timestamp = when;
    action.context = context;
    return action;
}

class RelationshipIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = fs::temp_directory_path() / ("tether_integration_" + std::to_string(::getpid()));
        fs::remove_all(directory_);
    }

    void TearDown() override {
        fs::remove_all(directory_);
    }

    /// Three weeks of mixed play: support, a control-taking streak, an
    /// apology, a public contradiction and steady repair afterwards
    void PlayThreeWeeks(ActionQueue& queue) {
        queue.Enqueue(Make(ActionType::PUBLIC_SUPPORT, 0.8f, start_, ContextType::PUBLIC));
        queue.Enqueue(Make(ActionType::PARENTING_PRESENT, 0.6f, start_ + kHour * 5));
        for (int i = 1; i <= 3; ++i) {
            queue.Enqueue(Make(ActionType::CONTROL_TAKING, -0.6f, start_ + kDay * i));
        }
        PlayerAction apology = Make(ActionType::APOLOGY, 0.5f, start_ + kDay * 4);
        apology.metadata["behavior_type"] = "CONTROL_TAKING";
        apology.metadata["apology_type"] = "ACTION_ORIENTED";
        queue.Enqueue(apology);
        queue.Drain();

        queue.Enqueue(Make(ActionType::PUBLIC_CONTRADICTION, -0.7f, start_ + kDay * 6, ContextType::PUBLIC));
        for (int day = 7; day < 21; ++day) {
            queue.Enqueue(Make(ActionType::STRESS_ACKNOWLEDGED, 0.5f, start_ + kDay * day));
            if (day % 3 == 0) {
                queue.Enqueue(Make(ActionType::PARENTING_PRESENT, 0.7f, start_ + kDay * day + kHour * 2));
            }
            if (queue.Size() >= 8) {
                queue.Drain();
            }
        }
        queue.Drain();
    }

    static void ExpectEquivalent(const PersonalityStateManager& a, const PersonalityStateManager& b) {
        PersonalityState sa = a.GetCurrentState();
        PersonalityState sb = b.GetCurrentState();
        EXPECT_NEAR(sa.trust_score, sb.trust_score, 0.01f);
        EXPECT_NEAR(sa.resentment_score, sb.resentment_score, 0.01f);
        EXPECT_NEAR(sa.emotional_safety, sb.emotional_safety, 0.01f);
        EXPECT_NEAR(sa.parenting_unity, sb.parenting_unity, 0.01f);
        EXPECT_EQ(sa.is_withdrawn, sb.is_withdrawn);
        EXPECT_EQ(sa.recent_patterns, sb.recent_patterns);
        EXPECT_EQ(sa.dominant_emotions, sb.dominant_emotions);

        EXPECT_EQ(a.GetMemorySystem().GetMemoryCount(), b.GetMemorySystem().GetMemoryCount());
        EXPECT_EQ(a.GetPatternTracker().GetHistorySize(), b.GetPatternTracker().GetHistorySize());
        EXPECT_EQ(a.GetPatternTracker().GetStoredPatterns().size(),
                  b.GetPatternTracker().GetStoredPatterns().size());

        ResponseModifiers ma = a.GetResponseModifiers();
        ResponseModifiers mb = b.GetResponseModifiers();
        EXPECT_NEAR(ma.cooperation_level, mb.cooperation_level, 0.01f);
        EXPECT_NEAR(ma.response_length_multiplier, mb.response_length_multiplier, 0.01f);
        EXPECT_NEAR(ma.emotional_vulnerability, mb.emotional_vulnerability, 0.01f);
    }

    fs::path directory_;
    Timestamp start_ = Timestamp::FromIso8601("2025-01-06T19:00:00Z");
};

} // namespace

TEST_F(RelationshipIntegrationTest, PublicSupportScenarioModifiers) {
    PersonalityStateManager manager;
    manager.ProcessAction(Make(ActionType::PUBLIC_SUPPORT, 0.8f, start_, ContextType::PUBLIC));

    EXPECT_FLOAT_EQ(63.2f, manager.GetCurrentState().trust_score);

    ResponseModifiers modifiers = manager.GetResponseModifiers();
    EXPECT_FLOAT_EQ(1.0f, modifiers.response_length_multiplier);
    EXPECT_FLOAT_EQ(1.0f, modifiers.cooperation_level);
    EXPECT_NEAR(0.62f, modifiers.initiation_probability, 0.001f);
    EXPECT_NEAR(0.6f, modifiers.emotional_vulnerability, 0.001f);
    EXPECT_FLOAT_EQ(0.0f, modifiers.interpretation_bias);
}

TEST_F(RelationshipIntegrationTest, ControlPatternLowersCooperation) {
    PersonalityStateManager manager;
    manager.ProcessAction(Make(ActionType::CONTROL_TAKING, -0.5f, start_));
    manager.ProcessAction(Make(ActionType::CONTROL_TAKING, -0.5f, start_ + kDay * 2));
    float before = manager.GetResponseModifiers().cooperation_level;
    EXPECT_FALSE(manager.GetPatternTracker().HasPattern(PatternType::CONTROL_TAKING, start_ + kDay * 2));

    manager.ProcessAction(Make(ActionType::CONTROL_TAKING, -0.5f, start_ + kDay * 5));

    const PatternTracker& tracker = manager.GetPatternTracker();
    auto patterns = tracker.GetAllPatterns(start_ + kDay * 5);
    ASSERT_EQ(1u, patterns.size());
    EXPECT_EQ(PatternType::CONTROL_TAKING, patterns[0].pattern_type);
    EXPECT_GE(tracker.GetPatternFrequency(PatternType::CONTROL_TAKING, start_ + kDay * 5),
              3.0f / 7.0f - 1e-5f);
    EXPECT_LT(manager.GetResponseModifiers().cooperation_level, before);
}

TEST_F(RelationshipIntegrationTest, PatternWeightFadesWithoutRecurrence) {
    PersonalityStateManager manager;
    for (int i = 0; i < 3; ++i) {
        manager.ProcessAction(Make(ActionType::STRESS_DISMISSED, -0.4f, start_ + kHour * i));
    }
    const PatternTracker& tracker = manager.GetPatternTracker();
    Timestamp formed = start_ + kHour * 2;

    float weight = tracker.GetPatternWeight(PatternType::EMOTIONAL_DISMISSAL, formed);
    ASSERT_GT(weight, 0.0f);
    for (int day = 1; day <= 5; ++day) {
        float next = tracker.GetPatternWeight(PatternType::EMOTIONAL_DISMISSAL, formed + kDay * day);
        EXPECT_LE(next, 0.9f * weight + 1e-5f);
        weight = next;
    }
}

TEST_F(RelationshipIntegrationTest, FileSaveLoadRoundTrip) {
    PersonalityStateManager original;
    ActionQueue queue(original);
    PlayThreeWeeks(queue);

    RelationshipSnapshot snapshot = original.CreateSnapshot(start_ + kDay * 21);

    PersistenceLayer layer(std::make_unique<FileSnapshotStore>(directory_.string()));
    ASSERT_TRUE(layer.Save(snapshot, "week3"));

    LoadResult loaded = layer.Load("week3");
    ASSERT_TRUE(loaded.ok()) << loaded.error;
    EXPECT_EQ(snapshot.patterns.size(), loaded.snapshot.patterns.size());
    EXPECT_EQ(snapshot.emotional_memories.size(), loaded.snapshot.emotional_memories.size());
    EXPECT_EQ(snapshot.apology_effectiveness.size(), loaded.snapshot.apology_effectiveness.size());
    for (size_t i = 0; i < snapshot.emotional_memories.size(); ++i) {
        EXPECT_NEAR(snapshot.emotional_memories[i].weight, loaded.snapshot.emotional_memories[i].weight, 0.01f);
        EXPECT_NEAR(snapshot.emotional_memories[i].emotional_impact.valence,
                    loaded.snapshot.emotional_memories[i].emotional_impact.valence, 0.01f);
    }

    PersonalityStateManager restored;
    restored.RestoreSnapshot(loaded.snapshot);
    ExpectEquivalent(original, restored);
}

TEST_F(RelationshipIntegrationTest, SqliteSaveLoadRoundTrip) {
    PersonalityStateManager original;
    ActionQueue queue(original);
    PlayThreeWeeks(queue);

    fs::create_directories(directory_);
    SqliteSnapshotStore::Config store_config;
    store_config.db_path = (directory_ / "saves.db").string();

    {
        PersistenceLayer layer(std::make_unique<SqliteSnapshotStore>(store_config));
        layer.SaveAsync(original.CreateSnapshot(start_ + kDay * 21));
    }

    PersistenceLayer layer(std::make_unique<SqliteSnapshotStore>(store_config));
    LoadResult loaded = layer.Load();
    ASSERT_TRUE(loaded.ok()) << loaded.error;

    PersonalityStateManager restored;
    restored.RestoreSnapshot(loaded.snapshot);
    ExpectEquivalent(original, restored);

    // Both continue identically after the restore
    PlayerAction next = Make(ActionType::EMPATHY_LACKING, -0.6f, start_ + kDay * 22);
    original.ProcessAction(next);
    restored.ProcessAction(next);
    ExpectEquivalent(original, restored);
}

TEST_F(RelationshipIntegrationTest, MissingSaveStartsFromDefaults) {
    PersistenceLayer layer(std::make_unique<FileSnapshotStore>(directory_.string()));
    LoadResult loaded = layer.Load();
    EXPECT_EQ(LoadStatus::NOT_FOUND, loaded.status);

    PersonalityStateManager manager;
    manager.RestoreSnapshot(loaded.snapshot);
    EXPECT_FLOAT_EQ(60.0f, manager.GetCurrentState().trust_score);
    EXPECT_FLOAT_EQ(10.0f, manager.GetCurrentState().resentment_score);
    EXPECT_FALSE(manager.GetCurrentState().is_withdrawn);
}

TEST_F(RelationshipIntegrationTest, SustainedNeglectLeadsToWithdrawalAndApologyRepair) {
    PersonalityStateManager manager;

    Timestamp when = start_;
    for (int i = 0; i < 6; ++i) {
        manager.ProcessAction(Make(ActionType::PARENTING_ABSENT, -0.6f, when));
        when = when + kDay;
    }
    PersonalityState neglected = manager.GetCurrentState();
    EXPECT_TRUE(neglected.is_withdrawn);
    EXPECT_NE(WithdrawalLevel::NONE, neglected.withdrawal_severity);
    EXPECT_LT(manager.GetResponseModifiers().response_length_multiplier, 1.0f);

    PlayerAction apology = Make(ActionType::APOLOGY, 0.6f, when);
    apology.metadata["behavior_type"] = "PARENTING_ABSENT";
    apology.metadata["apology_type"] = "ACTION_ORIENTED";
    manager.ProcessAction(apology);
    EXPECT_GT(manager.GetCurrentState().trust_score, neglected.trust_score);

    // Relapsing after the apology makes the next one worth less
    manager.ProcessAction(Make(ActionType::PARENTING_ABSENT, -0.6f, when + kDay));
    EXPECT_NEAR(0.8f, manager.GetTrustEngine().GetStoredEffectiveness("PARENTING_ABSENT", when + kDay),
                1e-5f);
}

TEST_F(RelationshipIntegrationTest, ConfiguredSessionUsesConfiguredStore) {
    auto config = RelationshipConfig::LoadFromString(
        "persistence:\n"
        "  backend: file\n"
        "  directory: \"" + directory_.string() + "\"\n"
        "  default_slot: session\n");
    ASSERT_TRUE(config.has_value());

    PersonalityStateManager manager(config->state);
    ActionQueue queue(manager, config->queue);
    queue.Enqueue(Make(ActionType::EMPATHY_SHOWN, 0.5f, start_));
    queue.Drain();

    PersistenceLayer layer(config->CreateStore(), config->persistence.layer);
    ASSERT_TRUE(layer.Save(manager.CreateSnapshot(start_)));
    EXPECT_TRUE(fs::exists(directory_ / "session.json"));
}
