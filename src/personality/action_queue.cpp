// File: src/personality/action_queue.cpp
#include "personality/action_queue.hpp"
#include <iostream>
#include <stdexcept>

namespace tether {

const char* ToString(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::ACCEPTED: return "ACCEPTED";
        case EnqueueResult::QUEUE_FULL: return "QUEUE_FULL";
    }
    return "UNKNOWN";
}

ActionQueue::ActionQueue(PersonalityStateManager& manager, const Config& config)
    : manager_(manager),
      config_(config)
{
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ActionQueue configuration");
    }
}

EnqueueResult ActionQueue::Enqueue(const PlayerAction& action) {
    std::lock_guard<std::mutex> lock(mutex_);

    EnqueueResult result = EnqueueResult::ACCEPTED;
    if (pending_.size() >= config_.max_depth) {
        ++overflow_count_;
        std::cerr << "[ActionQueue] Queue full (" << config_.max_depth
                  << "), applying oldest action early" << std::endl;
        ProcessTopLocked();
        result = EnqueueResult::QUEUE_FULL;
    }

    pending_.push(Entry{action, next_sequence_++});

    if (config_.debug_logging) {
        std::cout << "[ActionQueue] Enqueued " << action.ToString()
                  << " (depth " << pending_.size() << ")" << std::endl;
    }
    return result;
}

std::optional<ProcessStatus> ActionQueue::ProcessNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    return ProcessTopLocked();
}

size_t ActionQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;
    while (!pending_.empty()) {
        if (ProcessTopLocked() != ProcessStatus::DISCARDED_NON_FINITE) {
            ++applied;
        }
    }
    return applied;
}

size_t ActionQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool ActionQueue::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty();
}

uint64_t ActionQueue::GetOverflowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflow_count_;
}

ProcessStatus ActionQueue::ProcessTopLocked() {
    PlayerAction action = pending_.top().action;
    pending_.pop();
    return manager_.ProcessAction(action);
}

} // namespace tether
