#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <unordered_map>

namespace spendguard {

// Unique identifiers (opaque strings owned by the relational store)
using UserId = std::string;
using ConversationId = std::string;
using MemberId = std::string;
using MessageId = std::string;
using WalletId = std::string;
using RecordId = std::string;

// Fractional cents. Used for estimates and reservations, never rounded.
using Cents = double;

// Fixed-point money: 1 unit = 1e-8 dollars (matches numeric(20,8) columns)
using MoneyUnits = std::int64_t;

constexpr MoneyUnits MONEY_UNITS_PER_DOLLAR = 100000000;
constexpr MoneyUnits MONEY_UNITS_PER_CENT   = 1000000;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Wall clock, for calendar-day logic (free allowance, guest quota)
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// Requester tier. Trial behaves like guest for funds but is a separate session kind.
enum class UserTier {
    Guest,
    Trial,
    Free,
    Paid
};

// Who pays for a chat turn
enum class FundingSource {
    PersonalBalance,
    FreeAllowance,
    OwnerBalance,
    GuestFixed
};

// Why a chat turn was refused before any reservation
enum class DenialReason {
    PremiumRequiresBalance,
    InsufficientBalance,
    InsufficientFreeAllowance,
    GuestLimitExceeded
};

enum class WalletType {
    Purchased,
    FreeTier
};

enum class LedgerEntryType {
    Deposit,
    UsageCharge,
    Renewal
};

enum class SenderType {
    User,
    Ai
};

enum class UsageStatus {
    Pending,
    Completed
};

// Severity of a budget notice: Error blocks sending, Warning and Info do not
enum class NoticeSeverity {
    Error,
    Warning,
    Info
};

// Model pricing as advertised by the provider (fees NOT applied)
struct ModelPricing {
    std::string model_id;
    double input_price_per_token{0.0};
    double output_price_per_token{0.0};
    std::int64_t context_length{0};
    bool is_premium{false};
};

// Outstanding reservations across every counter key, for monitoring
struct LedgerSnapshot {
    Timestamp timestamp{};
    std::unordered_map<std::string, Cents> outstanding;
    Cents total_outstanding{0.0};
};

// ==================== Money helpers ====================

inline MoneyUnits dollars_to_units(double dollars) {
    return static_cast<MoneyUnits>(std::llround(dollars * static_cast<double>(MONEY_UNITS_PER_DOLLAR)));
}

inline double units_to_dollars(MoneyUnits units) {
    return static_cast<double>(units) / static_cast<double>(MONEY_UNITS_PER_DOLLAR);
}

inline Cents units_to_cents(MoneyUnits units) {
    return static_cast<double>(units) / static_cast<double>(MONEY_UNITS_PER_CENT);
}

inline MoneyUnits cents_to_units(Cents cents) {
    return static_cast<MoneyUnits>(std::llround(cents * static_cast<double>(MONEY_UNITS_PER_CENT)));
}

// Renders units as a dollar string with 8 decimals, e.g. "-0.00123000"
inline std::string format_dollars(MoneyUnits units) {
    const bool negative = units < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(units + 1)) + 1
        : static_cast<std::uint64_t>(units);
    const std::uint64_t whole = magnitude / MONEY_UNITS_PER_DOLLAR;
    const std::uint64_t frac = magnitude % MONEY_UNITS_PER_DOLLAR;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%llu.%08llu", negative ? "-" : "",
                  static_cast<unsigned long long>(whole),
                  static_cast<unsigned long long>(frac));
    return buf;
}

// ==================== Calendar helpers ====================

// Start of the UTC calendar day containing t
inline WallTime utc_day_start(WallTime t) {
    using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
    const auto since_epoch = t.time_since_epoch();
    auto days = std::chrono::duration_cast<Days>(since_epoch);
    if (days > since_epoch) days -= Days{1};
    return WallTime{std::chrono::duration_cast<WallClock::duration>(days)};
}

// ==================== to_string ====================

inline const char* to_string(UserTier t) {
    switch (t) {
        case UserTier::Guest: return "guest";
        case UserTier::Trial: return "trial";
        case UserTier::Free:  return "free";
        case UserTier::Paid:  return "paid";
    }
    return "unknown";
}

inline const char* to_string(FundingSource s) {
    switch (s) {
        case FundingSource::PersonalBalance: return "personal_balance";
        case FundingSource::FreeAllowance:   return "free_allowance";
        case FundingSource::OwnerBalance:    return "owner_balance";
        case FundingSource::GuestFixed:      return "guest_fixed";
    }
    return "unknown";
}

inline const char* to_string(DenialReason r) {
    switch (r) {
        case DenialReason::PremiumRequiresBalance:    return "premium_requires_balance";
        case DenialReason::InsufficientBalance:       return "insufficient_balance";
        case DenialReason::InsufficientFreeAllowance: return "insufficient_free_allowance";
        case DenialReason::GuestLimitExceeded:        return "guest_limit_exceeded";
    }
    return "unknown";
}

inline const char* to_string(WalletType t) {
    switch (t) {
        case WalletType::Purchased: return "purchased";
        case WalletType::FreeTier:  return "free_tier";
    }
    return "unknown";
}

inline const char* to_string(LedgerEntryType t) {
    switch (t) {
        case LedgerEntryType::Deposit:     return "deposit";
        case LedgerEntryType::UsageCharge: return "usage_charge";
        case LedgerEntryType::Renewal:     return "renewal";
    }
    return "unknown";
}

inline const char* to_string(NoticeSeverity s) {
    switch (s) {
        case NoticeSeverity::Error:   return "error";
        case NoticeSeverity::Warning: return "warning";
        case NoticeSeverity::Info:    return "info";
    }
    return "unknown";
}

// Guest and trial sessions share the fixed-quota funding rules
inline bool is_anonymous_tier(UserTier t) {
    return t == UserTier::Guest || t == UserTier::Trial;
}

} // namespace spendguard
