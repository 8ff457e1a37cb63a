// File: tests/memory/decay_functions_test.cpp
#include "memory/decay_functions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

using namespace tether;

namespace {
constexpr auto kDay = std::chrono::hours(24);
}

// ============================================================================
// DailyRateDecay Tests
// ============================================================================

TEST(DailyRateDecayTest, LosesTenPercentPerDay) {
    DailyRateDecay decay(0.1f);

    EXPECT_NEAR(0.9f, decay.ApplyDecay(1.0f, kDay), 1e-5f);
    EXPECT_NEAR(0.81f, decay.ApplyDecay(1.0f, kDay * 2), 1e-5f);
    EXPECT_NEAR(0.45f, decay.ApplyDecay(0.5f, kDay), 1e-5f);
}

TEST(DailyRateDecayTest, NeverLosesMoreThanRatePerDay) {
    DailyRateDecay decay(0.1f);

    float weight = 1.0f;
    for (int day = 1; day <= 20; ++day) {
        float next = decay.ApplyDecay(1.0f, kDay * day);
        EXPECT_LE(next, weight * 0.9f + 1e-5f);
        EXPECT_GE(next, 0.0f);
        weight = next;
    }
}

TEST(DailyRateDecayTest, FractionalDaysDecayFractionally) {
    DailyRateDecay decay(0.1f);
    float half_day = decay.ApplyDecay(1.0f, std::chrono::hours(12));
    EXPECT_NEAR(std::sqrt(0.9f), half_day, 1e-4f);
}

TEST(DailyRateDecayTest, NonPositiveElapsedTimeLeavesStrength) {
    DailyRateDecay decay(0.1f);
    EXPECT_FLOAT_EQ(0.7f, decay.ApplyDecay(0.7f, Timestamp::Duration(0)));
    EXPECT_FLOAT_EQ(0.7f, decay.ApplyDecay(0.7f, -kDay));
}

TEST(DailyRateDecayTest, RateIsClamped) {
    DailyRateDecay decay(1.5f);
    EXPECT_FLOAT_EQ(1.0f, decay.GetDailyRate());

    decay.SetDailyRate(-0.2f);
    EXPECT_FLOAT_EQ(0.0f, decay.GetDailyRate());
    EXPECT_FLOAT_EQ(1.0f, decay.ApplyDecay(1.0f, kDay * 100));
}

TEST(DailyRateDecayTest, HalfLife) {
    DailyRateDecay decay(0.1f);
    float half_life = decay.GetHalfLifeDays();
    EXPECT_NEAR(6.58f, half_life, 0.01f);
    EXPECT_TRUE(std::isinf(DailyRateDecay(0.0f).GetHalfLifeDays()));
}

TEST(DailyRateDecayTest, DecayAmount) {
    DailyRateDecay decay(0.1f);
    EXPECT_NEAR(0.1f, decay.GetDecayAmount(1.0f, kDay), 1e-5f);
}

// ============================================================================
// FreshnessTableDecay Tests
// ============================================================================

TEST(FreshnessTableDecayTest, DefaultBrackets) {
    FreshnessTableDecay decay;

    EXPECT_FLOAT_EQ(1.0f, decay.WeightForAge(std::chrono::hours(0)));
    EXPECT_FLOAT_EQ(1.0f, decay.WeightForAge(std::chrono::hours(23)));
    EXPECT_FLOAT_EQ(0.8f, decay.WeightForAge(std::chrono::hours(24)));
    EXPECT_FLOAT_EQ(0.8f, decay.WeightForAge(kDay * 6));
    EXPECT_FLOAT_EQ(0.5f, decay.WeightForAge(kDay * 7));
    EXPECT_FLOAT_EQ(0.5f, decay.WeightForAge(kDay * 29));
    EXPECT_FLOAT_EQ(0.3f, decay.WeightForAge(kDay * 30));
    EXPECT_FLOAT_EQ(0.3f, decay.WeightForAge(kDay * 400));
}

TEST(FreshnessTableDecayTest, NegativeAgeCountsAsFresh) {
    FreshnessTableDecay decay;
    EXPECT_FLOAT_EQ(1.0f, decay.WeightForAge(-kDay));
}

TEST(FreshnessTableDecayTest, ScalesInitialStrength) {
    FreshnessTableDecay decay;
    EXPECT_FLOAT_EQ(0.4f, decay.ApplyDecay(0.5f, kDay * 3));
    EXPECT_FLOAT_EQ(0.0f, decay.ApplyDecay(0.0f, kDay * 3));
}

TEST(FreshnessTableDecayTest, CustomBracketsAreSorted) {
    FreshnessTableDecay decay({{kDay * 10, 0.4f}, {kDay, 0.9f}}, 0.1f);

    ASSERT_EQ(2u, decay.GetBrackets().size());
    EXPECT_EQ(Timestamp::Duration(kDay), decay.GetBrackets()[0].max_age);
    EXPECT_FLOAT_EQ(0.9f, decay.WeightForAge(std::chrono::hours(1)));
    EXPECT_FLOAT_EQ(0.4f, decay.WeightForAge(kDay * 5));
    EXPECT_FLOAT_EQ(0.1f, decay.WeightForAge(kDay * 11));
    EXPECT_FLOAT_EQ(0.1f, decay.GetTailWeight());
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(DecayFactoryTest, CreatesByName) {
    auto daily = CreateDecayFunction("daily_rate");
    ASSERT_NE(nullptr, daily);
    EXPECT_STREQ("DailyRateDecay", daily->GetName());

    auto table = CreateDecayFunction("freshness_table");
    ASSERT_NE(nullptr, table);
    EXPECT_STREQ("FreshnessTableDecay", table->GetName());

    EXPECT_EQ(nullptr, CreateDecayFunction("exponential"));
}

TEST(DecayFactoryTest, CloneBehavesIdentically) {
    DailyRateDecay original(0.25f);
    auto clone = original.Clone();
    EXPECT_FLOAT_EQ(original.ApplyDecay(1.0f, kDay * 3), clone->ApplyDecay(1.0f, kDay * 3));
}
