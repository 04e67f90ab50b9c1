#pragma once

#include "spendguard/types.hpp"
#include <cstdint>
#include <string>

namespace spendguard {

// Provider price adjustment and storage accounting
struct PricingConfig {
    // Platform fee (5%) + card processing (4.5%) + provider fee (5.5%)
    double fee_rate = 0.15;

    // Dollars per stored character: $0.50/GB/month kept for 50 years, 1000 chars/KB
    double storage_cost_per_character = 0.0000003;
};

// Budget policy constants
struct BudgetConfig {
    // Requests that cannot afford this many output tokens are rejected
    std::int64_t minimum_output_tokens = 1000;

    // Paid tier may go this far below zero to absorb estimation error
    Cents paid_cushion_cents = 50.0;

    // Fixed per-message quota for guest and trial sessions
    Cents guest_fixed_cents = 1.0;

    // Paid users below this output budget get a low-balance warning
    std::int64_t low_balance_output_token_threshold = 10000;

    // Context usage fractions for capacity warnings
    double capacity_red_threshold = 0.67;
    double capacity_yellow_threshold = 0.33;

    // Absorbs dollar/cent round-trip error when comparing free allowance
    Cents free_tier_float_tolerance_cents = 1e-6;
};

// Atomic counter store keys
struct ReservationConfig {
    // Stale reservations from crashed requests expire after this long
    Duration key_ttl = std::chrono::seconds(180);

    // Key namespace, e.g. "chat" -> "chat:reserved:{userId}"
    std::string key_prefix = "chat";

    // Slack for floating-point accumulation when re-validating a new total
    Cents race_check_tolerance_cents = 1e-6;
};

// Daily allowances
struct AllowanceConfig {
    // Free-tier wallet is topped back up to this amount once per UTC day
    MoneyUnits daily_free_allowance = 5 * MONEY_UNITS_PER_CENT;

    // Messages per UTC day for unauthenticated guests
    std::int64_t guest_daily_message_limit = 5;
};

struct Config {
    PricingConfig pricing;
    BudgetConfig budget;
    ReservationConfig reservation;
    AllowanceConfig allowance;

    // Provider name recorded on LLM completion rows
    std::string provider_name = "openrouter";
};

} // namespace spendguard
