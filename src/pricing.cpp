#include "spendguard/pricing.hpp"

namespace spendguard {

namespace {

const TierPolicy TIER_POLICIES[] = {
    // tier             input                         output (storage)              cushion premium
    {UserTier::Guest, CHARS_PER_TOKEN_CONSERVATIVE, CHARS_PER_TOKEN_STANDARD,     false,  false},
    {UserTier::Trial, CHARS_PER_TOKEN_CONSERVATIVE, CHARS_PER_TOKEN_STANDARD,     false,  false},
    {UserTier::Free,  CHARS_PER_TOKEN_CONSERVATIVE, CHARS_PER_TOKEN_STANDARD,     false,  false},
    {UserTier::Paid,  CHARS_PER_TOKEN_STANDARD,     CHARS_PER_TOKEN_CONSERVATIVE, true,   true},
};

} // anonymous namespace

const TierPolicy& tier_policy(UserTier tier) {
    for (auto& p : TIER_POLICIES) {
        if (p.tier == tier) return p;
    }
    return TIER_POLICIES[0];
}

double apply_fees(double price_per_token, const PricingConfig& cfg) {
    return price_per_token * (1.0 + cfg.fee_rate);
}

std::int64_t estimate_tokens_for_tier(UserTier tier, std::int64_t character_count) {
    if (character_count <= 0) return 0;
    const std::int64_t cpt = tier_policy(tier).input_chars_per_token;
    return (character_count + cpt - 1) / cpt;
}

double output_cost_per_token(UserTier tier, double output_price_with_fees,
                             const PricingConfig& cfg) {
    const auto chars = static_cast<double>(tier_policy(tier).output_chars_per_token);
    return output_price_with_fees + chars * cfg.storage_cost_per_character;
}

Cents cushion_cents(UserTier tier, const BudgetConfig& cfg) {
    return tier_policy(tier).has_cushion ? cfg.paid_cushion_cents : 0.0;
}

double calculate_message_cost(const MessageCostParams& params, const PricingConfig& cfg) {
    const double model_cost =
        static_cast<double>(params.input_tokens) * params.price_per_input_token +
        static_cast<double>(params.output_tokens) * params.price_per_output_token;
    const double storage_fee =
        static_cast<double>(params.input_characters + params.output_characters) *
        cfg.storage_cost_per_character;
    return model_cost * (1.0 + cfg.fee_rate) + storage_fee;
}

UserTierInfo get_user_tier(const std::optional<UserBalanceState>& user) {
    UserTierInfo info;
    if (!user.has_value()) return info;

    info.tier = (user->balance_cents > 0.0) ? UserTier::Paid : UserTier::Free;
    info.can_access_premium = tier_policy(info.tier).can_access_premium;
    info.balance_cents = user->balance_cents;
    info.free_allowance_cents = user->free_allowance_cents;
    return info;
}

bool can_use_model(const UserTierInfo& info, bool is_premium_model) noexcept {
    if (!is_premium_model) return true;
    return info.can_access_premium;
}

} // namespace spendguard
