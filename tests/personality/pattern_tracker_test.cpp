// File: tests/personality/pattern_tracker_test.cpp
#include "personality/pattern_tracker.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace tether;

namespace {

constexpr auto kDay = std::chrono::hours(24);
constexpr auto kHour = std::chrono::hours(1);

PlayerAction Action(ActionType type, float valence, Timestamp when,
                    ContextType context = ContextType::PRIVATE) {
    PlayerAction action;
    action.action_type = type;
    action.context = context;
    action.valence = valence;
    action.timestamp = when;
    return action;
}

class PatternTrackerTest : public ::testing::Test {
protected:
    Timestamp base_ = Timestamp::FromIso8601("2024-06-01T09:00:00Z");

    void RecordControl(PatternTracker& tracker, int count, Timestamp start,
                       Timestamp::Duration spacing = kDay) {
        for (int i = 0; i < count; ++i) {
            tracker.RecordAction(Action(ActionType::CONTROL_TAKING, -0.5f, start + spacing * i));
        }
    }
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_F(PatternTrackerTest, DefaultConfig) {
    PatternTracker tracker;
    const auto& config = tracker.GetConfig();
    EXPECT_EQ(std::chrono::hours(24 * 7), config.time_window);
    EXPECT_EQ(3u, config.min_occurrences);
    EXPECT_FLOAT_EQ(0.1f, config.daily_decay_rate);
    EXPECT_EQ(5u, config.break_threshold);
}

TEST_F(PatternTrackerTest, InvalidConfigThrows) {
    PatternTracker::Config config;
    config.min_occurrences = 0;
    EXPECT_THROW(PatternTracker{config}, std::invalid_argument);

    PatternTracker::Config bad_rate;
    bad_rate.daily_decay_rate = 1.5f;
    EXPECT_THROW(PatternTracker{bad_rate}, std::invalid_argument);
}

// ============================================================================
// Recording
// ============================================================================

TEST_F(PatternTrackerTest, HistoryStaysInTimestampOrder) {
    PatternTracker tracker;
    tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.5f, base_ + kDay * 2));
    tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.5f, base_));
    tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.5f, base_ + kDay));

    const auto& history = tracker.GetHistory();
    ASSERT_EQ(3u, history.size());
    EXPECT_EQ(base_, history[0]->timestamp);
    EXPECT_EQ(base_ + kDay, history[1]->timestamp);
    EXPECT_EQ(base_ + kDay * 2, history[2]->timestamp);
}

// ============================================================================
// Detection
// ============================================================================

TEST_F(PatternTrackerTest, EmptyHistoryDetectsNothing) {
    PatternTracker tracker;
    EXPECT_TRUE(tracker.DetectPatterns(base_).empty());
    EXPECT_FLOAT_EQ(0.0f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, base_));
}

TEST_F(PatternTrackerTest, TwoOccurrencesAreNotAPattern) {
    PatternTracker tracker;
    RecordControl(tracker, 2, base_);
    EXPECT_TRUE(tracker.DetectPatterns(base_ + kDay).empty());
    EXPECT_FALSE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kDay));
}

TEST_F(PatternTrackerTest, ThreeOccurrencesInWindowFormPattern) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_);

    Timestamp now = base_ + kDay * 2;
    auto patterns = tracker.DetectPatterns(now);
    ASSERT_EQ(1u, patterns.size());

    const BehaviorPattern& pattern = patterns[0];
    EXPECT_EQ(PatternType::CONTROL_TAKING, pattern.pattern_type);
    EXPECT_EQ(3u, pattern.occurrences.size());
    EXPECT_FLOAT_EQ(1.0f, pattern.weight);
    EXPECT_NEAR(3.0f / 7.0f, pattern.frequency, 1e-5f);
    EXPECT_EQ(base_, pattern.first_seen);
    EXPECT_EQ(base_ + kDay * 2, pattern.last_seen);

    // Occurrences are the same objects the history owns
    EXPECT_EQ(tracker.GetHistory()[0].get(), pattern.occurrences[0].get());
}

TEST_F(PatternTrackerTest, OccurrencesOutsideWindowDoNotCount) {
    PatternTracker tracker;
    // Spread over 10 days: never three inside a 7-day window
    RecordControl(tracker, 3, base_, kDay * 5);
    EXPECT_TRUE(tracker.DetectPatterns(base_ + kDay * 10).empty());
}

TEST_F(PatternTrackerTest, CustomWindowOverload) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kDay * 5);
    auto patterns = tracker.DetectPatterns(kDay * 30, base_ + kDay * 10);
    ASSERT_EQ(1u, patterns.size());
    EXPECT_NEAR(3.0f / 30.0f, patterns[0].frequency, 1e-5f);
}

TEST_F(PatternTrackerTest, EmotionalDismissalGroupsTwoActionTypes) {
    PatternTracker tracker;
    tracker.RecordAction(Action(ActionType::STRESS_DISMISSED, -0.4f, base_));
    tracker.RecordAction(Action(ActionType::EMPATHY_LACKING, -0.4f, base_ + kHour));
    tracker.RecordAction(Action(ActionType::STRESS_DISMISSED, -0.4f, base_ + kHour * 2));

    tracker.DetectPatterns(base_ + kHour * 2);
    EXPECT_TRUE(tracker.HasPattern(PatternType::EMOTIONAL_DISMISSAL, base_ + kHour * 2));
}

TEST_F(PatternTrackerTest, FrequencyIsCountOverWindowDays) {
    PatternTracker tracker;
    RecordControl(tracker, 4, base_, kHour);
    EXPECT_NEAR(4.0f / 7.0f, tracker.GetPatternFrequency(PatternType::CONTROL_TAKING, base_ + kDay), 1e-5f);
    EXPECT_FLOAT_EQ(0.0f, tracker.GetPatternFrequency(PatternType::PUBLIC_UNITY, base_ + kDay));
}

// ============================================================================
// Decay
// ============================================================================

TEST_F(PatternTrackerTest, WeightDecaysTenPercentPerDay) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    Timestamp last = base_ + kHour * 2;
    tracker.DetectPatterns(last);

    EXPECT_FLOAT_EQ(1.0f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last));
    EXPECT_NEAR(0.9f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last + kDay), 1e-5f);
    EXPECT_NEAR(0.81f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last + kDay * 2), 1e-5f);

    // Never more than 10% per elapsed day
    for (int day = 1; day < 15; ++day) {
        float before = tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last + kDay * (day - 1));
        float after = tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last + kDay * day);
        EXPECT_LE(after, before * 0.9f + 1e-5f);
    }
}

TEST_F(PatternTrackerTest, RecurrenceRestoresFullWeight) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    tracker.DetectPatterns(base_ + kHour * 2);

    Timestamp later = base_ + kDay * 3;
    EXPECT_LT(tracker.GetPatternWeight(PatternType::CONTROL_TAKING, later), 0.75f);

    tracker.RecordAction(Action(ActionType::CONTROL_TAKING, -0.5f, later));
    EXPECT_FLOAT_EQ(1.0f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, later));
}

TEST_F(PatternTrackerTest, PatternDissolvesBelowRemovalThreshold) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    Timestamp last = base_ + kHour * 2;
    tracker.DetectPatterns(last);

    // 0.9^21 ≈ 0.109, 0.9^22 ≈ 0.098
    EXPECT_TRUE(tracker.HasPattern(PatternType::CONTROL_TAKING, last + kDay * 21));
    EXPECT_FALSE(tracker.HasPattern(PatternType::CONTROL_TAKING, last + kDay * 22));
    EXPECT_FLOAT_EQ(0.0f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, last + kDay * 22));

    tracker.DetectPatterns(last + kDay * 22);
    EXPECT_TRUE(tracker.GetStoredPatterns().empty());
}

// ============================================================================
// Breaking
// ============================================================================

TEST_F(PatternTrackerTest, FiveOpposingActionsBreakNegativePattern) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    tracker.DetectPatterns(base_ + kHour * 2);
    ASSERT_TRUE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 2));

    for (int i = 0; i < 4; ++i) {
        tracker.RecordAction(Action(ActionType::SUPPORTIVE_AUTONOMY, 0.6f, base_ + kHour * (3 + i)));
    }
    EXPECT_EQ(4u, tracker.GetConsecutiveOpposing(PatternType::CONTROL_TAKING));
    EXPECT_TRUE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 6));

    tracker.RecordAction(Action(ActionType::SUPPORTIVE_AUTONOMY, 0.6f, base_ + kHour * 7));
    EXPECT_FALSE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 7));
    EXPECT_FLOAT_EQ(0.0f, tracker.GetPatternWeight(PatternType::CONTROL_TAKING, base_ + kHour * 7));
    EXPECT_EQ(1u, tracker.GetBrokenAt().count(PatternType::CONTROL_TAKING));
    EXPECT_EQ(0u, tracker.GetConsecutiveOpposing(PatternType::CONTROL_TAKING));
}

TEST_F(PatternTrackerTest, WeakOrMatchingActionsResetOpposingCounter) {
    PatternTracker tracker;
    for (int i = 0; i < 3; ++i) {
        tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.6f, base_ + kHour * i));
    }
    EXPECT_EQ(3u, tracker.GetConsecutiveOpposing(PatternType::CONTROL_TAKING));

    // Valence at or below 0.3 does not oppose
    tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.3f, base_ + kHour * 3));
    EXPECT_EQ(0u, tracker.GetConsecutiveOpposing(PatternType::CONTROL_TAKING));

    tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.6f, base_ + kHour * 4));
    tracker.RecordAction(Action(ActionType::CONTROL_TAKING, -0.2f, base_ + kHour * 5));
    EXPECT_EQ(0u, tracker.GetConsecutiveOpposing(PatternType::CONTROL_TAKING));
}

TEST_F(PatternTrackerTest, BreakPatternRequiresThresholdAndNegativeType) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    tracker.DetectPatterns(base_ + kHour * 2);

    EXPECT_FALSE(tracker.BreakPattern(PatternType::CONTROL_TAKING, base_ + kHour * 3));
    EXPECT_FALSE(tracker.BreakPattern(PatternType::PUBLIC_UNITY, base_ + kHour * 3));
    EXPECT_TRUE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 3));
}

TEST_F(PatternTrackerTest, BrokenPatternOnlyReformsFromNewOccurrences) {
    PatternTracker tracker;
    RecordControl(tracker, 3, base_, kHour);
    tracker.DetectPatterns(base_ + kHour * 2);
    for (int i = 0; i < 5; ++i) {
        tracker.RecordAction(Action(ActionType::EMPATHY_SHOWN, 0.8f, base_ + kHour * (3 + i)));
    }
    ASSERT_FALSE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 8));

    // Old occurrences are still in the window but no longer count
    tracker.RecordAction(Action(ActionType::CONTROL_TAKING, -0.5f, base_ + kHour * 9));
    tracker.DetectPatterns(base_ + kHour * 9);
    EXPECT_FALSE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 9));
    EXPECT_EQ(1u, tracker.CountInWindow(PatternType::CONTROL_TAKING, kDay * 7, base_ + kHour * 9));

    RecordControl(tracker, 2, base_ + kHour * 10, kHour);
    tracker.DetectPatterns(base_ + kHour * 11);
    EXPECT_TRUE(tracker.HasPattern(PatternType::CONTROL_TAKING, base_ + kHour * 11));
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_F(PatternTrackerTest, ClearHistoryBeforeCutoff) {
    PatternTracker tracker;
    RecordControl(tracker, 4, base_);

    tracker.ClearHistory(base_ + kDay * 2);
    ASSERT_EQ(2u, tracker.GetHistorySize());
    EXPECT_EQ(base_ + kDay * 2, tracker.GetHistory()[0]->timestamp);

    tracker.ClearHistory();
    EXPECT_EQ(0u, tracker.GetHistorySize());
}

TEST_F(PatternTrackerTest, ActionsInWindowOldestFirst) {
    PatternTracker tracker;
    RecordControl(tracker, 5, base_);
    auto actions = tracker.GetActionsInWindow(kDay * 2, base_ + kDay * 3);
    ASSERT_EQ(3u, actions.size());
    EXPECT_EQ(base_ + kDay, actions.front()->timestamp);
    EXPECT_EQ(base_ + kDay * 3, actions.back()->timestamp);
}

TEST_F(PatternTrackerTest, RestoreRelinksOccurrencesToHistory) {
    PatternTracker source;
    RecordControl(source, 3, base_, kHour);
    source.DetectPatterns(base_ + kHour * 2);

    std::vector<PlayerAction> history;
    for (const auto& action : source.GetHistory()) {
        history.push_back(*action);
    }

    PatternTracker restored;
    restored.Restore(history, source.GetStoredPatterns(), source.GetBrokenAt());

    ASSERT_EQ(3u, restored.GetHistorySize());
    auto patterns = restored.GetAllPatterns(base_ + kHour * 2);
    ASSERT_EQ(1u, patterns.size());
    ASSERT_EQ(3u, patterns[0].occurrences.size());
    EXPECT_EQ(restored.GetHistory()[1].get(), patterns[0].occurrences[1].get());
    EXPECT_NEAR(source.GetPatternWeight(PatternType::CONTROL_TAKING, base_ + kDay * 3),
                restored.GetPatternWeight(PatternType::CONTROL_TAKING, base_ + kDay * 3), 1e-5f);
}
