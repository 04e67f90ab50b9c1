#include <gtest/gtest.h>
#include <spendguard/spendguard.hpp>

using namespace spendguard;

// ===========================================================================
// Fees and per-tier estimation
// ===========================================================================

TEST(PricingTest, ApplyFeesAddsFifteenPercent) {
    EXPECT_NEAR(apply_fees(1.0), 1.15, 1e-12);
    EXPECT_DOUBLE_EQ(apply_fees(0.0), 0.0);
}

TEST(PricingTest, ApplyFeesHonoursConfiguredRate) {
    PricingConfig cfg;
    cfg.fee_rate = 0.5;
    EXPECT_NEAR(apply_fees(2.0, cfg), 3.0, 1e-12);
}

TEST(PricingTest, PaidTierUsesStandardCharsPerToken) {
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Paid, 400), 100);
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Paid, 10), 3);
}

TEST(PricingTest, NonPaidTiersEstimateConservatively) {
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Free, 400), 200);
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Trial, 11), 6);
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Guest, 1), 1);
}

TEST(PricingTest, ZeroCharactersIsZeroTokens) {
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Paid, 0), 0);
    EXPECT_EQ(estimate_tokens_for_tier(UserTier::Free, 0), 0);
}

TEST(PricingTest, OutputStorageIsInvertedFromInput) {
    const auto& paid = tier_policy(UserTier::Paid);
    const auto& free = tier_policy(UserTier::Free);

    EXPECT_EQ(paid.input_chars_per_token, CHARS_PER_TOKEN_STANDARD);
    EXPECT_EQ(paid.output_chars_per_token, CHARS_PER_TOKEN_CONSERVATIVE);
    EXPECT_EQ(free.input_chars_per_token, CHARS_PER_TOKEN_CONSERVATIVE);
    EXPECT_EQ(free.output_chars_per_token, CHARS_PER_TOKEN_STANDARD);
}

TEST(PricingTest, OutputCostPerTokenIncludesStorage) {
    const double storage = PricingConfig{}.storage_cost_per_character;

    EXPECT_DOUBLE_EQ(output_cost_per_token(UserTier::Paid, 0.0), 2.0 * storage);
    EXPECT_DOUBLE_EQ(output_cost_per_token(UserTier::Free, 0.0), 4.0 * storage);
    EXPECT_GT(output_cost_per_token(UserTier::Guest, 0.0), 0.0);
}

TEST(PricingTest, CushionOnlyForPaidTier) {
    EXPECT_DOUBLE_EQ(cushion_cents(UserTier::Paid), 50.0);
    EXPECT_DOUBLE_EQ(cushion_cents(UserTier::Free), 0.0);
    EXPECT_DOUBLE_EQ(cushion_cents(UserTier::Trial), 0.0);
    EXPECT_DOUBLE_EQ(cushion_cents(UserTier::Guest), 0.0);
}

// ===========================================================================
// Actual message cost
// ===========================================================================

TEST(PricingTest, MessageCostAppliesFeesToModelCostOnly) {
    MessageCostParams p;
    p.input_tokens = 1000;
    p.output_tokens = 500;
    p.input_characters = 100;
    p.output_characters = 200;
    p.price_per_input_token = 0.000001;
    p.price_per_output_token = 0.000002;

    // (0.001 + 0.001) * 1.15 + 300 * 0.0000003
    EXPECT_NEAR(calculate_message_cost(p), 0.00239, 1e-12);
}

TEST(PricingTest, EmptyMessageCostsNothing) {
    MessageCostParams p;
    p.price_per_input_token = 0.000001;
    p.price_per_output_token = 0.000002;
    EXPECT_DOUBLE_EQ(calculate_message_cost(p), 0.0);
}

TEST(PricingTest, StorageOnlyMessage) {
    MessageCostParams p;
    p.input_characters = 1000;
    EXPECT_NEAR(calculate_message_cost(p), 0.0003, 1e-12);
}

// ===========================================================================
// Tier classification
// ===========================================================================

TEST(PricingTest, NoUserIsGuest) {
    auto info = get_user_tier(std::nullopt);
    EXPECT_EQ(info.tier, UserTier::Guest);
    EXPECT_FALSE(info.can_access_premium);
}

TEST(PricingTest, PositiveBalanceIsPaid) {
    auto info = get_user_tier(UserBalanceState{0.01, 5.0});
    EXPECT_EQ(info.tier, UserTier::Paid);
    EXPECT_TRUE(info.can_access_premium);
    EXPECT_DOUBLE_EQ(info.free_allowance_cents, 5.0);
}

TEST(PricingTest, ZeroOrNegativeBalanceIsFree) {
    EXPECT_EQ(get_user_tier(UserBalanceState{0.0, 5.0}).tier, UserTier::Free);
    EXPECT_EQ(get_user_tier(UserBalanceState{-20.0, 0.0}).tier, UserTier::Free);
}

TEST(PricingTest, PremiumModelsRequirePaidTier) {
    auto paid = get_user_tier(UserBalanceState{100.0, 0.0});
    auto free = get_user_tier(UserBalanceState{0.0, 5.0});

    EXPECT_TRUE(can_use_model(paid, true));
    EXPECT_TRUE(can_use_model(paid, false));
    EXPECT_FALSE(can_use_model(free, true));
    EXPECT_TRUE(can_use_model(free, false));
}

// ===========================================================================
// Money helpers
// ===========================================================================

TEST(MoneyTest, FormatDollarsUsesEightDecimals) {
    EXPECT_EQ(format_dollars(1234), "0.00001234");
    EXPECT_EQ(format_dollars(5 * MONEY_UNITS_PER_DOLLAR), "5.00000000");
    EXPECT_EQ(format_dollars(-2000), "-0.00002000");
    EXPECT_EQ(format_dollars(0), "0.00000000");
}

TEST(MoneyTest, CentsAndUnitsConvert) {
    EXPECT_EQ(cents_to_units(5.0), 5 * MONEY_UNITS_PER_CENT);
    EXPECT_DOUBLE_EQ(units_to_cents(50 * MONEY_UNITS_PER_CENT), 50.0);
    EXPECT_EQ(dollars_to_units(0.00239), 239000);
    EXPECT_DOUBLE_EQ(units_to_dollars(MONEY_UNITS_PER_DOLLAR), 1.0);
}

TEST(MoneyTest, UtcDayStartTruncatesToMidnight) {
    const WallTime t = WallTime{} + std::chrono::hours(24 * 3 + 5) + std::chrono::minutes(7);
    EXPECT_EQ(utc_day_start(t), WallTime{} + std::chrono::hours(24 * 3));
    EXPECT_EQ(utc_day_start(utc_day_start(t)), utc_day_start(t));
}
