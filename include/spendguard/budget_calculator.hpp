#pragma once

#include "spendguard/config.hpp"
#include "spendguard/pricing.hpp"
#include "spendguard/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spendguard {

struct BudgetInput {
    UserTier tier{UserTier::Guest};

    // Both already net of in-flight reservations
    Cents balance_cents{0.0};
    Cents free_allowance_cents{0.0};

    // Owner-funded group chat: min of conversation/member/owner remaining.
    // When set it replaces the tier's own funds and no cushion applies.
    std::optional<Cents> group_effective_cents;

    // System prompt + history + new message
    std::int64_t prompt_character_count{0};

    // Fees applied
    double input_price_per_token{0.0};
    double output_price_per_token{0.0};

    std::int64_t context_length{0};
};

struct BudgetResult {
    bool can_afford{false};
    std::int64_t max_output_tokens{0};
    std::int64_t estimated_input_tokens{0};

    // Dollars
    double estimated_input_cost{0.0};
    double output_cost_per_token{0.0};
    double estimated_minimum_cost{0.0};
    double effective_balance{0.0};

    // Context usage: ceil(chars / 4) + minimum output tokens
    std::int64_t current_usage{0};
    double capacity_percent{0.0};
};

// Effective funds in dollars: guest/trial fixed quota, free allowance, or paid balance + cushion
double effective_balance(UserTier tier, Cents balance_cents, Cents free_allowance_cents,
                         const BudgetConfig& cfg = BudgetConfig{});

BudgetResult calculate_budget(const BudgetInput& input, const Config& cfg = Config{});

// Budget clamped to the model context. nullopt means the budget does not
// constrain the call and the provider default (context - input) applies.
std::optional<std::int64_t> compute_safe_max_tokens(std::int64_t budget_max_tokens,
                                                    std::int64_t context_length,
                                                    std::int64_t estimated_input_tokens);

// Un-rounded worst-case charge in cents: (input cost + max tokens * per-token cost) * 100
Cents compute_worst_case_cents(double estimated_input_cost,
                               std::int64_t effective_max_output_tokens,
                               double output_cost_per_token);

// Minimum of the three group constraints. Zero and negative values are kept.
Cents effective_budget_cents(Cents conversation_remaining_cents,
                             Cents member_remaining_cents,
                             Cents owner_remaining_cents);

// ==================== Notifications ====================

struct BudgetNotice {
    std::string id;
    NoticeSeverity severity{NoticeSeverity::Info};
    std::string message;
};

// Outcome of funding resolution: a source, or a denial reason
struct BillingDecision {
    std::optional<FundingSource> funding_source;
    std::optional<DenialReason> denial;

    bool denied() const noexcept { return denial.has_value(); }

    static BillingDecision fund(FundingSource s) { return {s, std::nullopt}; }
    static BillingDecision deny(DenialReason r) { return {std::nullopt, r}; }
};

std::vector<BudgetNotice> generate_notifications(const BillingDecision& decision,
                                                 double capacity_percent,
                                                 std::int64_t max_output_tokens,
                                                 const BudgetConfig& cfg = BudgetConfig{});

} // namespace spendguard
