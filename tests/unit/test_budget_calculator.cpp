#include <gtest/gtest.h>
#include <spendguard/spendguard.hpp>

#include <algorithm>

using namespace spendguard;

namespace {

// $0.50 / $1.50 per million tokens before fees
constexpr double BASIC_INPUT_PRICE = 0.0000005;
constexpr double BASIC_OUTPUT_PRICE = 0.0000015;

BudgetInput basic_input(UserTier tier, std::int64_t chars) {
    BudgetInput in;
    in.tier = tier;
    in.prompt_character_count = chars;
    in.input_price_per_token = apply_fees(BASIC_INPUT_PRICE);
    in.output_price_per_token = apply_fees(BASIC_OUTPUT_PRICE);
    in.context_length = 128000;
    return in;
}

bool has_notice(const std::vector<BudgetNotice>& notices, const std::string& id) {
    return std::any_of(notices.begin(), notices.end(),
                       [&](const BudgetNotice& n) { return n.id == id; });
}

} // anonymous namespace

// ===========================================================================
// Free tier
// ===========================================================================

TEST(BudgetCalculatorTest, FreeAllowanceCoversSmallPrompt) {
    auto in = basic_input(UserTier::Free, 400);
    in.free_allowance_cents = 5.0;

    auto r = calculate_budget(in);

    EXPECT_TRUE(r.can_afford);
    EXPECT_EQ(r.estimated_input_tokens, 200);
    EXPECT_NEAR(r.estimated_input_cost, 0.000235, 1e-12);
    EXPECT_NEAR(r.output_cost_per_token, 0.000002925, 1e-15);
    EXPECT_NEAR(r.estimated_minimum_cost, 0.00316, 1e-12);
    EXPECT_EQ(r.max_output_tokens, 17013);
    EXPECT_GT(r.max_output_tokens, 1000);

    const Cents worst = compute_worst_case_cents(r.estimated_input_cost, r.max_output_tokens,
                                                 r.output_cost_per_token);
    EXPECT_LE(worst, 5.0 + 1e-9);
}

TEST(BudgetCalculatorTest, AllowanceEqualToMinimumAffordsExactlyMinimum) {
    auto baseline = calculate_budget(basic_input(UserTier::Free, 400));

    auto in = basic_input(UserTier::Free, 400);
    in.free_allowance_cents = baseline.estimated_minimum_cost * 100.0;
    auto r = calculate_budget(in);

    EXPECT_TRUE(r.can_afford);
    EXPECT_EQ(r.max_output_tokens, 1000);
}

TEST(BudgetCalculatorTest, AllowanceOneTokenShortIsRejected) {
    auto baseline = calculate_budget(basic_input(UserTier::Free, 400));

    auto in = basic_input(UserTier::Free, 400);
    in.free_allowance_cents = (baseline.estimated_minimum_cost - baseline.output_cost_per_token) * 100.0;
    auto r = calculate_budget(in);

    EXPECT_FALSE(r.can_afford);
    EXPECT_EQ(r.max_output_tokens, 0);
}

TEST(BudgetCalculatorTest, FreeTierIgnoresPurchasedBalance) {
    auto in = basic_input(UserTier::Free, 400);
    in.balance_cents = 10000.0;
    in.free_allowance_cents = 0.0;

    auto r = calculate_budget(in);
    EXPECT_FALSE(r.can_afford);
    EXPECT_DOUBLE_EQ(r.effective_balance, 0.0);
}

// ===========================================================================
// Paid tier
// ===========================================================================

TEST(BudgetCalculatorTest, PaidIncludesCushion) {
    auto in = basic_input(UserTier::Paid, 400);
    in.balance_cents = 50.0;   // $10 balance with 950 cents already reserved

    auto r = calculate_budget(in);

    EXPECT_TRUE(r.can_afford);
    EXPECT_DOUBLE_EQ(r.effective_balance, 1.0);
    EXPECT_EQ(r.estimated_input_tokens, 100);
    EXPECT_NEAR(r.estimated_input_cost, 0.0001775, 1e-12);
    EXPECT_EQ(r.max_output_tokens, 430031);
}

TEST(BudgetCalculatorTest, PaidFullyReservedStillHasCushion) {
    auto in = basic_input(UserTier::Paid, 400);
    in.balance_cents = 0.0;

    auto r = calculate_budget(in);
    EXPECT_TRUE(r.can_afford);
    EXPECT_DOUBLE_EQ(r.effective_balance, 0.5);
}

TEST(BudgetCalculatorTest, PaidWorstCaseAtContextLimit) {
    auto in = basic_input(UserTier::Paid, 400);
    in.balance_cents = 1000.0;
    auto r = calculate_budget(in);

    auto safe = compute_safe_max_tokens(r.max_output_tokens, in.context_length, r.estimated_input_tokens);
    EXPECT_FALSE(safe.has_value());

    const std::int64_t room = in.context_length - r.estimated_input_tokens;
    EXPECT_EQ(room, 127900);
    EXPECT_NEAR(compute_worst_case_cents(r.estimated_input_cost, room, r.output_cost_per_token),
                29.7545, 1e-9);
}

TEST(BudgetCalculatorTest, MaxTokensMonotonicInBalance) {
    std::int64_t previous = 0;
    for (Cents balance : {0.0, 1.0, 10.0, 100.0, 1000.0, 10000.0}) {
        auto in = basic_input(UserTier::Paid, 2000);
        in.balance_cents = balance;
        auto r = calculate_budget(in);
        EXPECT_GE(r.max_output_tokens, previous) << "balance " << balance;
        previous = r.max_output_tokens;
    }
}

TEST(BudgetCalculatorTest, GroupEffectiveReplacesOwnFunds) {
    auto in = basic_input(UserTier::Free, 400);
    in.free_allowance_cents = 0.0;
    in.group_effective_cents = 5.0;

    auto r = calculate_budget(in);
    EXPECT_TRUE(r.can_afford);
    EXPECT_DOUBLE_EQ(r.effective_balance, 0.05);
    EXPECT_EQ(r.max_output_tokens, 17013);
}

TEST(BudgetCalculatorTest, ZeroGroupBudgetIsUnaffordable) {
    auto in = basic_input(UserTier::Paid, 400);
    in.balance_cents = 100000.0;
    in.group_effective_cents = 0.0;

    EXPECT_FALSE(calculate_budget(in).can_afford);
}

// ===========================================================================
// Guest and trial
// ===========================================================================

TEST(BudgetCalculatorTest, GuestUsesFixedQuota) {
    auto in = basic_input(UserTier::Guest, 400);
    in.balance_cents = 500.0;

    auto r = calculate_budget(in);
    EXPECT_TRUE(r.can_afford);
    EXPECT_DOUBLE_EQ(r.effective_balance, 0.01);
    EXPECT_EQ(r.max_output_tokens, 3338);
}

TEST(BudgetCalculatorTest, TrialMatchesGuest) {
    auto guest = calculate_budget(basic_input(UserTier::Guest, 1234));
    auto trial = calculate_budget(basic_input(UserTier::Trial, 1234));

    EXPECT_EQ(guest.max_output_tokens, trial.max_output_tokens);
    EXPECT_DOUBLE_EQ(guest.estimated_minimum_cost, trial.estimated_minimum_cost);
}

TEST(BudgetCalculatorTest, EffectiveBalancePerTier) {
    EXPECT_DOUBLE_EQ(effective_balance(UserTier::Guest, 999.0, 999.0), 0.01);
    EXPECT_DOUBLE_EQ(effective_balance(UserTier::Free, 999.0, 3.0), 0.03);
    EXPECT_DOUBLE_EQ(effective_balance(UserTier::Paid, 150.0, 3.0), 2.0);
}

// ===========================================================================
// Capacity
// ===========================================================================

TEST(BudgetCalculatorTest, CapacityUsesStandardRatio) {
    auto r = calculate_budget(basic_input(UserTier::Free, 400));
    EXPECT_EQ(r.current_usage, 1100);
    EXPECT_NEAR(r.capacity_percent, 1100.0 / 128000.0 * 100.0, 1e-12);
}

TEST(BudgetCalculatorTest, EmptyPromptStillCountsMinimumOutput) {
    auto r = calculate_budget(basic_input(UserTier::Paid, 0));
    EXPECT_EQ(r.estimated_input_tokens, 0);
    EXPECT_EQ(r.current_usage, 1000);
}

TEST(BudgetCalculatorTest, UnknownContextLengthHasNoCapacity) {
    auto in = basic_input(UserTier::Paid, 400);
    in.context_length = 0;
    EXPECT_DOUBLE_EQ(calculate_budget(in).capacity_percent, 0.0);
}

// ===========================================================================
// Safe max tokens and worst case
// ===========================================================================

TEST(BudgetCalculatorTest, SafeMaxClampsToBudget) {
    auto safe = compute_safe_max_tokens(5000, 128000, 100);
    ASSERT_TRUE(safe.has_value());
    EXPECT_EQ(safe.value(), 5000);
}

TEST(BudgetCalculatorTest, SafeMaxDefersToProviderWhenBudgetIsLarger) {
    EXPECT_FALSE(compute_safe_max_tokens(200000, 128000, 100).has_value());
    EXPECT_FALSE(compute_safe_max_tokens(127900, 128000, 100).has_value());
}

TEST(BudgetCalculatorTest, SafeMaxNeverNegative) {
    auto safe = compute_safe_max_tokens(-5, 128000, 100);
    ASSERT_TRUE(safe.has_value());
    EXPECT_EQ(safe.value(), 0);
}

TEST(BudgetCalculatorTest, WorstCaseIsNotRounded) {
    EXPECT_NEAR(compute_worst_case_cents(0.001, 1000, 0.00001), 1.1, 1e-12);
    EXPECT_NEAR(compute_worst_case_cents(0.0000001, 1, 0.0000001), 0.00002, 1e-15);
}

TEST(BudgetCalculatorTest, EffectiveBudgetIsMinimum) {
    EXPECT_DOUBLE_EQ(effective_budget_cents(10.0, 20.0, 30.0), 10.0);
    EXPECT_DOUBLE_EQ(effective_budget_cents(40.0, 20.0, 30.0), 20.0);
    EXPECT_DOUBLE_EQ(effective_budget_cents(10.0, -5.0, 3.0), -5.0);
    EXPECT_DOUBLE_EQ(effective_budget_cents(0.0, 20.0, 30.0), 0.0);
}

// ===========================================================================
// Notifications
// ===========================================================================

TEST(NotificationTest, DenialProducesBlockingError) {
    auto notices = generate_notifications(BillingDecision::deny(DenialReason::InsufficientBalance), 10.0, 0);

    ASSERT_TRUE(has_notice(notices, "insufficient_balance"));
    EXPECT_EQ(notices.front().severity, NoticeSeverity::Error);
}

TEST(NotificationTest, EachDenialHasItsOwnNotice) {
    EXPECT_TRUE(has_notice(generate_notifications(
        BillingDecision::deny(DenialReason::PremiumRequiresBalance), 0.0, 0), "premium_requires_balance"));
    EXPECT_TRUE(has_notice(generate_notifications(
        BillingDecision::deny(DenialReason::InsufficientFreeAllowance), 0.0, 0), "insufficient_free_allowance"));
    EXPECT_TRUE(has_notice(generate_notifications(
        BillingDecision::deny(DenialReason::GuestLimitExceeded), 0.0, 0), "guest_limit_exceeded"));
}

TEST(NotificationTest, OverCapacityIsError) {
    auto notices = generate_notifications(BillingDecision::fund(FundingSource::PersonalBalance), 101.0, 50000);
    EXPECT_TRUE(has_notice(notices, "capacity_exceeded"));
    EXPECT_FALSE(has_notice(notices, "capacity_warning"));
}

TEST(NotificationTest, NearCapacityWarnsOnlyWhenNotBlocked) {
    auto ok = generate_notifications(BillingDecision::fund(FundingSource::PersonalBalance), 70.0, 50000);
    EXPECT_TRUE(has_notice(ok, "capacity_warning"));

    auto denied = generate_notifications(BillingDecision::deny(DenialReason::InsufficientBalance), 70.0, 0);
    EXPECT_FALSE(has_notice(denied, "capacity_warning"));

    auto low = generate_notifications(BillingDecision::fund(FundingSource::PersonalBalance), 50.0, 50000);
    EXPECT_FALSE(has_notice(low, "capacity_warning"));
}

TEST(NotificationTest, LowBalanceOnlyForPersonalFunding) {
    EXPECT_TRUE(has_notice(generate_notifications(
        BillingDecision::fund(FundingSource::PersonalBalance), 1.0, 9999), "low_balance"));
    EXPECT_FALSE(has_notice(generate_notifications(
        BillingDecision::fund(FundingSource::PersonalBalance), 1.0, 10000), "low_balance"));
    EXPECT_FALSE(has_notice(generate_notifications(
        BillingDecision::fund(FundingSource::OwnerBalance), 1.0, 5000), "low_balance"));
}

TEST(NotificationTest, FreeAndGuestInfoNotices) {
    auto free = generate_notifications(BillingDecision::fund(FundingSource::FreeAllowance), 1.0, 5000);
    ASSERT_TRUE(has_notice(free, "free_tier_notice"));
    EXPECT_EQ(free.back().severity, NoticeSeverity::Info);

    auto guest = generate_notifications(BillingDecision::fund(FundingSource::GuestFixed), 1.0, 3000);
    EXPECT_TRUE(has_notice(guest, "trial_notice"));
    EXPECT_FALSE(has_notice(guest, "free_tier_notice"));
}
