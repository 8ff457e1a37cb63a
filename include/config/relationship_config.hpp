// File: include/config/relationship_config.hpp
//
// YAML Configuration Support for tether
// Loads every relationship tunable (pattern windows, decay rates, trust
// rates, thresholds, queue depth, save backend) from a YAML file

#ifndef TETHER_CONFIG_RELATIONSHIP_CONFIG_HPP
#define TETHER_CONFIG_RELATIONSHIP_CONFIG_HPP

#include "personality/action_queue.hpp"
#include "personality/personality_state_manager.hpp"
#include "storage/persistence_layer.hpp"
#include "storage/snapshot_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/// Configuration for one relationship session
///
/// YAML sections map onto component configs:
///   patterns    → state.patterns   (PatternTracker)
///   memory      → state.memory     (EmotionalMemorySystem)
///   trust       → state.trust      (TrustDynamicsEngine)
///   state       → state            (PersonalityStateManager)
///   queue       → queue            (ActionQueue)
///   persistence → persistence      (PersistenceLayer and its store)
struct RelationshipConfig {
    PersonalityStateManager::Config state;

    ActionQueue::Config queue;

    struct Persistence {
        /// "file" or "sqlite"
        std::string backend = "file";
        /// Save directory for the file backend
        std::string directory = "saves";
        /// Database path for the sqlite backend
        std::string database_path = "tether_saves.db";
        PersistenceLayer::Config layer;
    } persistence;

    /// Load configuration from YAML file
    /// @return Configuration if successful, std::nullopt on error
    static std::optional<RelationshipConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @return Configuration if successful, std::nullopt on error
    static std::optional<RelationshipConfig> LoadFromString(const std::string& yaml_content);

    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    std::string ToYamlString() const;

    /// @return true if configuration is valid
    bool Validate() const;

    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Build the configured snapshot store
    /// @throws std::runtime_error if the sqlite database cannot be opened
    std::unique_ptr<SnapshotStore> CreateStore() const;

    /// Create default configuration
    static RelationshipConfig Default();
};

} // namespace tether

#endif // TETHER_CONFIG_RELATIONSHIP_CONFIG_HPP
