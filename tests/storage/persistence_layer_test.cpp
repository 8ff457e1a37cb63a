// File: tests/storage/persistence_layer_test.cpp
#include "storage/persistence_layer.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace tether;

namespace {

/// Shared view of what the in-memory store saw, kept alive after the
/// PersistenceLayer takes ownership of the store
struct StoreLog {
    std::mutex mutex;
    std::map<std::string, std::string> slots;
    std::vector<std::string> written;  // documents in write order
    int write_calls{0};
    int failures_remaining{0};
    std::chrono::milliseconds first_write_delay{0};
};

class InMemoryStore : public SnapshotStore {
public:
    explicit InMemoryStore(std::shared_ptr<StoreLog> log) : log_(std::move(log)) {}

    StoreStatus Write(const std::string& slot, const std::string& document) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            if (++log_->write_calls == 1) {
                delay = log_->first_write_delay;
            }
        }
        std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(log_->mutex);
        if (log_->failures_remaining > 0) {
            --log_->failures_remaining;
            return StoreStatus::IO_ERROR;
        }
        log_->slots[slot] = document;
        log_->written.push_back(document);
        return StoreStatus::OK;
    }

    StoreStatus Read(const std::string& slot, std::string* document) const override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        auto it = log_->slots.find(slot);
        if (it == log_->slots.end()) {
            return StoreStatus::NOT_FOUND;
        }
        *document = it->second;
        return StoreStatus::OK;
    }

    StoreStatus Remove(const std::string& slot) override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        return log_->slots.erase(slot) > 0 ? StoreStatus::OK : StoreStatus::NOT_FOUND;
    }

    std::vector<std::string> List() const override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        std::vector<std::string> slots;
        for (const auto& entry : log_->slots) {
            slots.push_back(entry.first);
        }
        return slots;
    }

    bool Exists(const std::string& slot) const override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        return log_->slots.count(slot) > 0;
    }

private:
    std::shared_ptr<StoreLog> log_;
};

class PersistenceLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<StoreLog>();
        layer_ = std::make_unique<PersistenceLayer>(std::make_unique<InMemoryStore>(log_));
    }

    static RelationshipSnapshot WithTrust(float trust) {
        RelationshipSnapshot snapshot;
        snapshot.timestamp = Timestamp::FromIso8601("2024-12-01T12:00:00Z");
        snapshot.trust_score = trust;
        return snapshot;
    }

    static void ExpectDefaults(const LoadResult& result) {
        EXPECT_FLOAT_EQ(60.0f, result.snapshot.trust_score);
        EXPECT_FLOAT_EQ(10.0f, result.snapshot.resentment_score);
        EXPECT_FLOAT_EQ(50.0f, result.snapshot.emotional_safety);
        EXPECT_FLOAT_EQ(70.0f, result.snapshot.parenting_unity);
        EXPECT_TRUE(result.snapshot.patterns.empty());
        EXPECT_TRUE(result.snapshot.emotional_memories.empty());
    }

    std::shared_ptr<StoreLog> log_;
    std::unique_ptr<PersistenceLayer> layer_;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(PersistenceLayerConfigTest, RejectsNullStoreAndBadConfig) {
    EXPECT_THROW(PersistenceLayer(nullptr), std::invalid_argument);

    PersistenceLayer::Config config;
    config.default_slot = "not a slot";
    EXPECT_THROW(PersistenceLayer(std::make_unique<InMemoryStore>(std::make_shared<StoreLog>()), config),
                 std::invalid_argument);

    PersistenceLayer::Config attempts;
    attempts.save_attempts = 0;
    EXPECT_FALSE(attempts.IsValid());
}

// ============================================================================
// Save / Load
// ============================================================================

TEST_F(PersistenceLayerTest, SaveThenLoad) {
    ASSERT_TRUE(layer_->Save(WithTrust(42.5f)));
    EXPECT_TRUE(layer_->HasSave("autosave"));

    LoadResult result = layer_->Load();
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_NEAR(42.5f, result.snapshot.trust_score, 0.01f);
    EXPECT_EQ(1u, layer_->GetSaveCount());
}

TEST_F(PersistenceLayerTest, MissingSaveGivesDefaults) {
    LoadResult result = layer_->Load("slot1");
    EXPECT_EQ(LoadStatus::NOT_FOUND, result.status);
    EXPECT_FALSE(result.ok());
    ExpectDefaults(result);
}

TEST_F(PersistenceLayerTest, CorruptSaveGivesDefaults) {
    log_->slots["autosave"] = "{\"version\": \"1.0\", \"trust_score\": ";

    LoadResult result = layer_->Load();
    EXPECT_EQ(LoadStatus::PARSE_ERROR, result.status);
    EXPECT_FALSE(result.error.empty());
    ExpectDefaults(result);
}

TEST_F(PersistenceLayerTest, InvalidSaveGivesDefaults) {
    nlohmann::json document = EncodeDocument(WithTrust(30.0f));
    document["trust_score"] = 250.0;
    log_->slots["autosave"] = document.dump();

    LoadResult result = layer_->Load();
    EXPECT_EQ(LoadStatus::VALIDATION_ERROR, result.status);
    ExpectDefaults(result);
}

TEST_F(PersistenceLayerTest, InvalidSlotName) {
    EXPECT_FALSE(layer_->Save(WithTrust(55.0f), "../escape"));
    EXPECT_EQ(1u, layer_->GetFailedSaveCount());
    EXPECT_EQ(0, log_->write_calls);

    LoadResult result = layer_->Load("../escape");
    EXPECT_EQ(LoadStatus::IO_FAILURE, result.status);
    ExpectDefaults(result);
}

TEST_F(PersistenceLayerTest, SaveRetriesOnce) {
    log_->failures_remaining = 1;

    EXPECT_TRUE(layer_->Save(WithTrust(45.0f)));
    EXPECT_EQ(2, log_->write_calls);
    EXPECT_EQ(1u, layer_->GetSaveCount());
    EXPECT_EQ(0u, layer_->GetFailedSaveCount());
}

TEST_F(PersistenceLayerTest, SaveGivesUpAfterRetry) {
    log_->failures_remaining = 5;

    EXPECT_FALSE(layer_->Save(WithTrust(45.0f)));
    EXPECT_EQ(2, log_->write_calls);
    EXPECT_EQ(0u, layer_->GetSaveCount());
    EXPECT_EQ(1u, layer_->GetFailedSaveCount());
    EXPECT_FALSE(layer_->HasSave("autosave"));
}

TEST_F(PersistenceLayerTest, CompactDocumentsWhenPrettyPrintIsOff) {
    PersistenceLayer::Config config;
    config.pretty_print = false;
    auto log = std::make_shared<StoreLog>();
    PersistenceLayer compact(std::make_unique<InMemoryStore>(log), config);

    ASSERT_TRUE(compact.Save(WithTrust(61.0f)));
    EXPECT_EQ(std::string::npos, log->slots["autosave"].find('\n'));
}

// ============================================================================
// Asynchronous saves
// ============================================================================

TEST_F(PersistenceLayerTest, AsyncSavesKeepSubmissionOrder) {
    for (int i = 1; i <= 20; ++i) {
        layer_->SaveAsync(WithTrust(static_cast<float>(i)));
    }
    layer_->WaitForPendingSaves();

    ASSERT_EQ(20u, log_->written.size());
    for (int i = 1; i <= 20; ++i) {
        DecodeResult decoded = DecodeDocumentText(log_->written[i - 1]);
        ASSERT_EQ(LoadStatus::OK, decoded.status);
        EXPECT_FLOAT_EQ(static_cast<float>(i), decoded.snapshot->trust_score);
    }

    LoadResult latest = layer_->Load();
    ASSERT_TRUE(latest.ok());
    EXPECT_FLOAT_EQ(20.0f, latest.snapshot.trust_score);
}

TEST_F(PersistenceLayerTest, FailedAsyncSaveIsDropped) {
    log_->failures_remaining = 2;
    layer_->SaveAsync(WithTrust(10.0f), "slot1");
    layer_->SaveAsync(WithTrust(20.0f), "slot1");
    layer_->WaitForPendingSaves();

    EXPECT_EQ(1u, layer_->GetFailedSaveCount());
    EXPECT_EQ(1u, layer_->GetSaveCount());
    EXPECT_FLOAT_EQ(20.0f, layer_->Load("slot1").snapshot.trust_score);
}

TEST_F(PersistenceLayerTest, DestructorFinishesPendingSaves) {
    for (int i = 0; i < 5; ++i) {
        layer_->SaveAsync(WithTrust(50.0f + i));
    }
    layer_.reset();

    EXPECT_EQ(5u, log_->written.size());
}

TEST_F(PersistenceLayerTest, SynchronousSaveWaitsForEarlierAsyncSaves) {
    log_->first_write_delay = std::chrono::milliseconds(150);

    layer_->SaveAsync(WithTrust(11.0f));
    EXPECT_TRUE(layer_->Save(WithTrust(22.0f)));
    layer_->WaitForPendingSaves();

    ASSERT_EQ(2u, log_->written.size());
    EXPECT_FLOAT_EQ(11.0f, DecodeDocumentText(log_->written[0]).snapshot->trust_score);
    EXPECT_FLOAT_EQ(22.0f, DecodeDocumentText(log_->written[1]).snapshot->trust_score);
    EXPECT_FLOAT_EQ(22.0f, layer_->Load().snapshot.trust_score);
}

// ============================================================================
// Untrusted text
// ============================================================================

namespace {

RelationshipSnapshot WithInvalidUtf8() {
    RelationshipSnapshot snapshot;
    snapshot.timestamp = Timestamp::FromIso8601("2024-12-01T12:00:00Z");
    snapshot.trust_score = 58.0f;

    PlayerAction apology;
    apology.action_type = ActionType::APOLOGY;
    apology.valence = 0.5f;
    apology.timestamp = snapshot.timestamp;
    apology.metadata["behavior_type"] = "CONTROL\xff";
    snapshot.action_history.push_back(apology);

    ApologyRecord record;
    record.last_apology = snapshot.timestamp;
    snapshot.apology_effectiveness["CONTROL\xff"] = record;
    return snapshot;
}

} // namespace

TEST_F(PersistenceLayerTest, InvalidUtf8IsReplacedOnSave) {
    EXPECT_TRUE(layer_->Save(WithInvalidUtf8()));
    EXPECT_EQ(0u, layer_->GetFailedSaveCount());

    LoadResult result = layer_->Load();
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_FLOAT_EQ(58.0f, result.snapshot.trust_score);
    EXPECT_EQ(1u, result.snapshot.apology_effectiveness.count("CONTROL\xEF\xBF\xBD"));
    ASSERT_EQ(1u, result.snapshot.action_history.size());
    EXPECT_EQ("CONTROL\xEF\xBF\xBD", result.snapshot.action_history[0].metadata.at("behavior_type"));
}

TEST_F(PersistenceLayerTest, InvalidUtf8AsyncSaveDoesNotStopWriter) {
    layer_->SaveAsync(WithInvalidUtf8(), "slot1");
    layer_->SaveAsync(WithTrust(40.0f), "slot2");
    layer_->WaitForPendingSaves();

    EXPECT_EQ(2u, layer_->GetSaveCount());
    EXPECT_EQ(0u, layer_->GetFailedSaveCount());
    EXPECT_TRUE(layer_->Load("slot1").ok());
    EXPECT_FLOAT_EQ(40.0f, layer_->Load("slot2").snapshot.trust_score);
}

// ============================================================================
// Slots
// ============================================================================

TEST_F(PersistenceLayerTest, ListAndDeleteSaves) {
    layer_->Save(WithTrust(50.0f), "slot2");
    layer_->Save(WithTrust(51.0f), "slot1");

    std::vector<std::string> expected = {"slot1", "slot2"};
    EXPECT_EQ(expected, layer_->ListSaves());

    EXPECT_TRUE(layer_->DeleteSave("slot1"));
    EXPECT_FALSE(layer_->DeleteSave("slot1"));
    EXPECT_FALSE(layer_->HasSave("slot1"));
    EXPECT_TRUE(layer_->HasSave("slot2"));
}
