#pragma once

#include "spendguard/config.hpp"
#include "spendguard/types.hpp"

#include <cstdint>
#include <optional>

namespace spendguard {

constexpr std::int64_t CHARS_PER_TOKEN_CONSERVATIVE = 2;
constexpr std::int64_t CHARS_PER_TOKEN_STANDARD     = 4;

// Per-tier numeric policy. Free and anonymous traffic is estimated
// conservatively on input; output storage accounting is the inverse.
struct TierPolicy {
    UserTier tier;
    std::int64_t input_chars_per_token;
    std::int64_t output_chars_per_token;
    bool has_cushion;
    bool can_access_premium;
};

const TierPolicy& tier_policy(UserTier tier);

// Provider price adjusted by the platform fee multiplier
double apply_fees(double price_per_token, const PricingConfig& cfg = PricingConfig{});

// ceil(chars / chars-per-token for the tier); zero characters is zero tokens
std::int64_t estimate_tokens_for_tier(UserTier tier, std::int64_t character_count);

// Dollars per output token including output storage for the tier
double output_cost_per_token(UserTier tier, double output_price_with_fees,
                             const PricingConfig& cfg = PricingConfig{});

// Paid cushion in cents; zero for every other tier
Cents cushion_cents(UserTier tier, const BudgetConfig& cfg = BudgetConfig{});

// ==================== Actual message cost ====================

struct MessageCostParams {
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::int64_t input_characters{0};
    std::int64_t output_characters{0};
    double price_per_input_token{0.0};   // provider price, fees not applied
    double price_per_output_token{0.0};
};

// Model cost with fees plus raw storage fee, in dollars
double calculate_message_cost(const MessageCostParams& params,
                              const PricingConfig& cfg = PricingConfig{});

// ==================== Tier classification ====================

struct UserBalanceState {
    Cents balance_cents{0.0};
    Cents free_allowance_cents{0.0};
};

struct UserTierInfo {
    UserTier tier{UserTier::Guest};
    bool can_access_premium{false};
    Cents balance_cents{0.0};
    Cents free_allowance_cents{0.0};
};

// No user -> guest; purchased balance > 0 -> paid; otherwise free
UserTierInfo get_user_tier(const std::optional<UserBalanceState>& user);

bool can_use_model(const UserTierInfo& info, bool is_premium_model) noexcept;

} // namespace spendguard
