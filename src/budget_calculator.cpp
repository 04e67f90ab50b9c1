#include "spendguard/budget_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace spendguard {

namespace {

// Absorbs the dollar -> cent -> dollar round trip when flooring token counts
constexpr double TOKEN_FLOOR_EPSILON = 1e-9;

} // anonymous namespace

double effective_balance(UserTier tier, Cents balance_cents, Cents free_allowance_cents,
                         const BudgetConfig& cfg) {
    switch (tier) {
        case UserTier::Guest:
        case UserTier::Trial:
            return cfg.guest_fixed_cents / 100.0;
        case UserTier::Free:
            return free_allowance_cents / 100.0;
        case UserTier::Paid:
            return (balance_cents + cushion_cents(tier, cfg)) / 100.0;
    }
    return 0.0;
}

BudgetResult calculate_budget(const BudgetInput& input, const Config& cfg) {
    const auto& budget_cfg = cfg.budget;
    const auto& pricing_cfg = cfg.pricing;
    BudgetResult r;

    // 1. Tier-dependent input estimate, storage of the prompt included
    r.estimated_input_tokens = estimate_tokens_for_tier(input.tier, input.prompt_character_count);
    r.estimated_input_cost =
        static_cast<double>(r.estimated_input_tokens) * input.input_price_per_token +
        static_cast<double>(input.prompt_character_count) * pricing_cfg.storage_cost_per_character;

    // 2. Output per-token cost carries the (inverted) storage rate, so it is never zero
    r.output_cost_per_token = output_cost_per_token(input.tier, input.output_price_per_token, pricing_cfg);
    r.estimated_minimum_cost = r.estimated_input_cost +
        static_cast<double>(budget_cfg.minimum_output_tokens) * r.output_cost_per_token;

    // 3. Funds
    r.effective_balance = input.group_effective_cents.has_value()
        ? input.group_effective_cents.value() / 100.0
        : effective_balance(input.tier, input.balance_cents, input.free_allowance_cents, budget_cfg);

    // 4. Affordability
    const double tolerance = budget_cfg.free_tier_float_tolerance_cents / 100.0;
    r.can_afford = r.effective_balance + tolerance >= r.estimated_minimum_cost;

    // 5. Largest affordable output budget
    if (r.can_afford) {
        const double remaining = r.effective_balance - r.estimated_input_cost;
        const double tokens = std::floor(remaining / r.output_cost_per_token + TOKEN_FLOOR_EPSILON);
        r.max_output_tokens = std::max<std::int64_t>(0, static_cast<std::int64_t>(tokens));
    }

    // 6. Capacity always uses the standard ratio: the context window does not depend on tier
    const std::int64_t capacity_input_tokens =
        input.prompt_character_count <= 0 ? 0
        : (input.prompt_character_count + CHARS_PER_TOKEN_STANDARD - 1) / CHARS_PER_TOKEN_STANDARD;
    r.current_usage = capacity_input_tokens + budget_cfg.minimum_output_tokens;
    r.capacity_percent = input.context_length > 0
        ? static_cast<double>(r.current_usage) / static_cast<double>(input.context_length) * 100.0
        : 0.0;

    return r;
}

std::optional<std::int64_t> compute_safe_max_tokens(std::int64_t budget_max_tokens,
                                                    std::int64_t context_length,
                                                    std::int64_t estimated_input_tokens) {
    const std::int64_t context_room = std::max<std::int64_t>(0, context_length - estimated_input_tokens);
    if (budget_max_tokens >= context_room) return std::nullopt;
    return std::max<std::int64_t>(0, budget_max_tokens);
}

Cents compute_worst_case_cents(double estimated_input_cost,
                               std::int64_t effective_max_output_tokens,
                               double output_cost_per_token) {
    return (estimated_input_cost +
            static_cast<double>(effective_max_output_tokens) * output_cost_per_token) * 100.0;
}

Cents effective_budget_cents(Cents conversation_remaining_cents,
                             Cents member_remaining_cents,
                             Cents owner_remaining_cents) {
    return std::min({conversation_remaining_cents, member_remaining_cents, owner_remaining_cents});
}

// ========== Notifications ==========

std::vector<BudgetNotice> generate_notifications(const BillingDecision& decision,
                                                 double capacity_percent,
                                                 std::int64_t max_output_tokens,
                                                 const BudgetConfig& cfg) {
    std::vector<BudgetNotice> notices;

    if (decision.denied()) {
        switch (decision.denial.value()) {
            case DenialReason::PremiumRequiresBalance:
                notices.push_back({"premium_requires_balance", NoticeSeverity::Error,
                                   "This model requires a paid account."});
                break;
            case DenialReason::InsufficientBalance:
                notices.push_back({"insufficient_balance", NoticeSeverity::Error,
                                   "Insufficient balance. Top up or try a more affordable model."});
                break;
            case DenialReason::InsufficientFreeAllowance:
                notices.push_back({"insufficient_free_allowance", NoticeSeverity::Error,
                                   "Your free daily usage can't cover this message. "
                                   "Top up or try a shorter conversation."});
                break;
            case DenialReason::GuestLimitExceeded:
                notices.push_back({"guest_limit_exceeded", NoticeSeverity::Error,
                                   "This message exceeds the usage limit."});
                break;
        }
    }

    const bool over_capacity = capacity_percent > 100.0;
    if (over_capacity) {
        notices.push_back({"capacity_exceeded", NoticeSeverity::Error,
                           "Message exceeds model capacity. Shorten your message or start a new conversation."});
    }

    const bool blocking = over_capacity || decision.denied();
    if (!blocking && capacity_percent >= cfg.capacity_red_threshold * 100.0) {
        notices.push_back({"capacity_warning", NoticeSeverity::Warning,
                           "Your conversation is near this model's memory limit. Responses may be cut short."});
    }

    if (decision.funding_source == FundingSource::PersonalBalance &&
        max_output_tokens < cfg.low_balance_output_token_threshold) {
        notices.push_back({"low_balance", NoticeSeverity::Warning,
                           "Low balance. Long responses may be shortened."});
    }

    if (decision.funding_source == FundingSource::FreeAllowance) {
        notices.push_back({"free_tier_notice", NoticeSeverity::Info,
                           "Using free allowance. Top up for longer conversations."});
    } else if (decision.funding_source == FundingSource::GuestFixed) {
        notices.push_back({"trial_notice", NoticeSeverity::Info,
                           "Free preview. Sign up for full access."});
    }

    return notices;
}

} // namespace spendguard
