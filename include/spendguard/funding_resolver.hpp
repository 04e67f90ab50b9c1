#pragma once

#include "spendguard/billing_store.hpp"
#include "spendguard/budget_calculator.hpp"
#include "spendguard/config.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/pricing.hpp"
#include "spendguard/reservation_ledger.hpp"
#include "spendguard/types.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace spendguard {

// ==================== Pure decision ====================

struct ResolveBillingInput {
    UserTier tier{UserTier::Guest};

    // Net of in-flight reservations
    Cents balance_cents{0.0};
    Cents free_allowance_cents{0.0};

    bool is_premium_model{false};
    Cents estimated_minimum_cost_cents{0.0};

    struct Group {
        Cents effective_cents{0.0};
        UserTier owner_tier{UserTier::Free};
        Cents owner_balance_cents{0.0};
    };
    std::optional<Group> group;
};

// Group owner first, then the premium gate, then the requester's own tier
BillingDecision resolve_billing(const ResolveBillingInput& input,
                                const BudgetConfig& cfg = BudgetConfig{});

// ==================== Group budgets ====================

struct GroupRemaining {
    Cents conversation_remaining_cents{0.0};
    Cents member_remaining_cents{0.0};
    Cents owner_remaining_cents{0.0};
};

struct GroupBudgetInput {
    MoneyUnits conversation_budget{0};
    MoneyUnits conversation_spent{0};
    MoneyUnits member_budget{0};
    MoneyUnits member_spent{0};
    Cents owner_balance_cents{0.0};
    GroupReservedTotals reserved;
};

// Each scope is ceiling - spent - reserved; negative values are kept
GroupRemaining compute_group_remaining(const GroupBudgetInput& input);

// A member (not the owner) chatting in an owner-funded conversation
struct GroupContext {
    ConversationId conversation_id;
    MemberId member_id;
    UserId owner_id;
};

// ==================== Store-backed resolution ====================

struct GroupFunding {
    GroupReservationScope scope;
    GroupRemaining remaining;
    Cents effective_cents{0.0};
    UserTierInfo owner;

    // Raw values for the post-reservation race check
    GroupCeilings ceilings;
};

// Everything the budget calculator and the race check need for one turn
struct BillingContext {
    std::optional<UserId> user_id;

    // Raw balances after lazy renewal, before reservations
    UserTierInfo user;

    Cents reserved_cents{0.0};
    Cents available_balance_cents{0.0};
    Cents available_free_allowance_cents{0.0};

    std::optional<GroupFunding> group;
};

ResolveBillingInput to_resolve_input(const BillingContext& context, bool is_premium_model,
                                     Cents estimated_minimum_cost_cents);

// Ceiling the personal reservation total may not exceed for the chosen source
Cents personal_ceiling_cents(const BillingContext& context, FundingSource source,
                             const BudgetConfig& cfg = BudgetConfig{});

class FundingResolver {
public:
    FundingResolver(std::shared_ptr<BillingStore> store,
                    std::shared_ptr<ReservationLedger> ledger,
                    Config config = Config{});

    FundingResolver(const FundingResolver&) = delete;
    FundingResolver& operator=(const FundingResolver&) = delete;

    // Tops the free-tier wallet back up once per UTC day. Safe to race:
    // the raise only applies while balance < allowance, and the renewal
    // ledger entry is written in the same transaction.
    // Returns the wallet balance after the call.
    MoneyUnits maybe_renew_free_allowance(const WalletId& wallet_id, WallTime now = WallClock::now());

    // Purchased wallet sum and free-tier balance, renewal applied first.
    // No user means guest.
    UserTierInfo user_tier_info(const std::optional<UserId>& user_id, WallTime now = WallClock::now());

    // Reads wallets, budgets and every gating reservation total
    BillingContext build_context(const std::optional<UserId>& user_id,
                                 const std::optional<GroupContext>& group = std::nullopt,
                                 WallTime now = WallClock::now());

    // resolve_billing over the context; emits BillingDenied on a denial
    BillingDecision resolve(const BillingContext& context, bool is_premium_model,
                            Cents estimated_minimum_cost_cents);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::shared_ptr<BillingStore> store_;
    std::shared_ptr<ReservationLedger> ledger_;
    Config config_;
    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    void emit_event(EventType type, const std::string& message,
                    std::optional<UserId> user_id = std::nullopt,
                    std::optional<Cents> amount_cents = std::nullopt);
};

} // namespace spendguard
