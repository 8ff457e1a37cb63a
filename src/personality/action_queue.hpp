// File: src/personality/action_queue.hpp
#pragma once

#include "personality/personality_state_manager.hpp"
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace tether {

// EnqueueResult: Outcome of offering an action to the queue
enum class EnqueueResult : uint8_t {
    ACCEPTED = 0,
    QUEUE_FULL = 1,  // Queue was full; the oldest queued action was applied first
};

const char* ToString(EnqueueResult result);

/// ActionQueue: Bounded, timestamp-ordered buffer in front of a manager
///
/// Concurrent producers enqueue actions; Drain() applies them oldest first.
/// When the queue is full the oldest queued action is applied immediately to
/// make room, and the overflow is reported to the caller.
///
/// Thread-safety: All methods are thread-safe.
class ActionQueue {
public:
    struct Config {
        Config() {}
        /// Maximum queued actions
        size_t max_depth{10};
        /// Print debug output to stdout
        bool debug_logging{false};

        bool IsValid() const { return max_depth > 0; }
    };

    /// @throws std::invalid_argument if config is invalid
    explicit ActionQueue(PersonalityStateManager& manager, const Config& config = Config());

    ActionQueue(const ActionQueue&) = delete;
    ActionQueue& operator=(const ActionQueue&) = delete;

    EnqueueResult Enqueue(const PlayerAction& action);

    /// Apply the oldest queued action
    /// @return Its status, or nullopt when the queue is empty
    std::optional<ProcessStatus> ProcessNext();

    /// Apply every queued action in timestamp order
    /// @return Number of actions applied (discarded actions excluded)
    size_t Drain();

    size_t Size() const;
    bool Empty() const;
    uint64_t GetOverflowCount() const;
    const Config& GetConfig() const { return config_; }

private:
    struct Entry {
        PlayerAction action;
        uint64_t sequence;
    };

    /// Orders the heap so the oldest (then first-enqueued) entry is on top
    struct LaterFirst {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.action.timestamp != b.action.timestamp) {
                return a.action.timestamp > b.action.timestamp;
            }
            return a.sequence > b.sequence;
        }
    };

    PersonalityStateManager& manager_;
    Config config_;

    mutable std::mutex mutex_;
    std::priority_queue<Entry, std::vector<Entry>, LaterFirst> pending_;
    uint64_t next_sequence_{0};
    uint64_t overflow_count_{0};

    /// Pop and apply the top entry; caller holds mutex_
    ProcessStatus ProcessTopLocked();
};

} // namespace tether
