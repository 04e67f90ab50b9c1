#include "spendguard/funding_resolver.hpp"
#include "spendguard/exceptions.hpp"

#include <stdexcept>
#include <utility>

namespace spendguard {

// ========== Pure decision ==========

namespace {

std::optional<BillingDecision> resolve_group_billing(const std::optional<ResolveBillingInput::Group>& group,
                                                     bool is_premium_model) {
    if (!group.has_value() || group->effective_cents <= 0.0) return std::nullopt;

    UserTierInfo owner;
    owner.tier = group->owner_tier;
    owner.can_access_premium = tier_policy(group->owner_tier).can_access_premium;
    owner.balance_cents = group->owner_balance_cents;

    if (can_use_model(owner, is_premium_model)) {
        return BillingDecision::fund(FundingSource::OwnerBalance);
    }
    // Owner cannot serve this model: fall through to personal billing
    return std::nullopt;
}

} // anonymous namespace

BillingDecision resolve_billing(const ResolveBillingInput& input, const BudgetConfig& cfg) {
    if (auto group = resolve_group_billing(input.group, input.is_premium_model)) {
        return group.value();
    }

    UserTierInfo user;
    user.tier = input.tier;
    user.can_access_premium = tier_policy(input.tier).can_access_premium;
    user.balance_cents = input.balance_cents;
    user.free_allowance_cents = input.free_allowance_cents;
    if (!can_use_model(user, input.is_premium_model)) {
        return BillingDecision::deny(DenialReason::PremiumRequiresBalance);
    }

    switch (input.tier) {
        case UserTier::Paid: {
            const Cents effective = input.balance_cents + cushion_cents(input.tier, cfg);
            if (effective >= input.estimated_minimum_cost_cents) {
                return BillingDecision::fund(FundingSource::PersonalBalance);
            }
            return BillingDecision::deny(DenialReason::InsufficientBalance);
        }
        case UserTier::Free:
            if (input.free_allowance_cents + cfg.free_tier_float_tolerance_cents >=
                input.estimated_minimum_cost_cents) {
                return BillingDecision::fund(FundingSource::FreeAllowance);
            }
            return BillingDecision::deny(DenialReason::InsufficientFreeAllowance);
        case UserTier::Guest:
        case UserTier::Trial:
            break;
    }

    if (input.estimated_minimum_cost_cents <= cfg.guest_fixed_cents) {
        return BillingDecision::fund(FundingSource::GuestFixed);
    }
    return BillingDecision::deny(DenialReason::GuestLimitExceeded);
}

GroupRemaining compute_group_remaining(const GroupBudgetInput& input) {
    GroupRemaining r;
    r.conversation_remaining_cents = units_to_cents(input.conversation_budget) -
                                     units_to_cents(input.conversation_spent) -
                                     input.reserved.conversation_total;
    r.member_remaining_cents = units_to_cents(input.member_budget) -
                               units_to_cents(input.member_spent) -
                               input.reserved.member_total;
    r.owner_remaining_cents = input.owner_balance_cents - input.reserved.payer_total;
    return r;
}

ResolveBillingInput to_resolve_input(const BillingContext& context, bool is_premium_model,
                                     Cents estimated_minimum_cost_cents) {
    ResolveBillingInput input;
    input.tier = context.user.tier;
    input.balance_cents = context.available_balance_cents;
    input.free_allowance_cents = context.available_free_allowance_cents;
    input.is_premium_model = is_premium_model;
    input.estimated_minimum_cost_cents = estimated_minimum_cost_cents;

    if (context.group.has_value()) {
        const auto& g = context.group.value();
        ResolveBillingInput::Group group;
        group.effective_cents = g.effective_cents;
        group.owner_tier = g.owner.tier;
        group.owner_balance_cents = g.remaining.owner_remaining_cents;
        input.group = group;
    }
    return input;
}

Cents personal_ceiling_cents(const BillingContext& context, FundingSource source,
                             const BudgetConfig& cfg) {
    switch (source) {
        case FundingSource::PersonalBalance:
            return context.user.balance_cents + cushion_cents(context.user.tier, cfg);
        case FundingSource::FreeAllowance:
            return context.user.free_allowance_cents;
        case FundingSource::GuestFixed:
            return cfg.guest_fixed_cents;
        case FundingSource::OwnerBalance:
            if (!context.group.has_value()) {
                throw std::logic_error("Owner-funded turn without a group context");
            }
            return context.group->ceilings.payer_ceiling;
    }
    return 0.0;
}

// ========== FundingResolver ==========

FundingResolver::FundingResolver(std::shared_ptr<BillingStore> store,
                                 std::shared_ptr<ReservationLedger> ledger,
                                 Config config)
    : store_(std::move(store))
    , ledger_(std::move(ledger))
    , config_(std::move(config))
{
    if (!store_ || !ledger_) {
        throw std::invalid_argument("FundingResolver requires a billing store and a reservation ledger");
    }
}

MoneyUnits FundingResolver::maybe_renew_free_allowance(const WalletId& wallet_id, WallTime now) {
    const MoneyUnits allowance = config_.allowance.daily_free_allowance;
    const WallTime today = utc_day_start(now);
    std::optional<MoneyUnits> renewed_by;

    const MoneyUnits balance = store_->transaction([&](BillingStore::Transaction& tx) -> MoneyUnits {
        const auto wallet = tx.find_wallet(wallet_id);
        if (!wallet.has_value()) {
            throw ConstraintViolationException("wallets: no row with id " + wallet_id);
        }

        const auto last = tx.last_renewal_at(wallet_id);
        if (last.has_value() && last.value() >= today) return wallet->balance;

        // Zero rows updated: already at or above the allowance
        if (!tx.raise_free_wallet_to(wallet_id, allowance)) return wallet->balance;

        LedgerEntry entry;
        entry.wallet_id = wallet_id;
        entry.amount = allowance - wallet->balance;
        entry.balance_after = allowance;
        entry.entry_type = LedgerEntryType::Renewal;
        entry.source_wallet_id = wallet_id;
        entry.created_at = now;
        tx.insert_ledger_entry(std::move(entry));

        renewed_by = allowance - wallet->balance;
        return allowance;
    });

    if (renewed_by.has_value()) {
        const auto wallet = store_->wallet(wallet_id);
        emit_event(EventType::FreeAllowanceRenewed,
                   "Free allowance renewed to " + format_dollars(allowance),
                   wallet.has_value() ? std::optional<UserId>(wallet->user_id) : std::nullopt,
                   units_to_cents(renewed_by.value()));
    }
    return balance;
}

UserTierInfo FundingResolver::user_tier_info(const std::optional<UserId>& user_id, WallTime now) {
    if (!user_id.has_value()) return get_user_tier(std::nullopt);

    MoneyUnits purchased = 0;
    MoneyUnits free_allowance = 0;
    std::optional<WalletId> free_wallet;
    for (auto& w : store_->wallets(user_id.value())) {
        if (w.type == WalletType::Purchased) {
            purchased += w.balance;
        } else if (w.type == WalletType::FreeTier) {
            free_allowance = w.balance;
            free_wallet = w.id;
        }
    }

    if (free_wallet.has_value()) {
        free_allowance = maybe_renew_free_allowance(free_wallet.value(), now);
    }

    UserBalanceState state;
    state.balance_cents = units_to_cents(purchased);
    state.free_allowance_cents = units_to_cents(free_allowance);
    return get_user_tier(state);
}

BillingContext FundingResolver::build_context(const std::optional<UserId>& user_id,
                                              const std::optional<GroupContext>& group,
                                              WallTime now) {
    BillingContext ctx;
    ctx.user_id = user_id;
    ctx.user = user_tier_info(user_id, now);

    if (user_id.has_value()) {
        ctx.reserved_cents = ledger_->reserved_total(user_id.value());
    }
    ctx.available_balance_cents = ctx.user.balance_cents - ctx.reserved_cents;
    // A free user's in-flight reservations are drawn from the allowance
    ctx.available_free_allowance_cents = (ctx.user.tier == UserTier::Free)
        ? ctx.user.free_allowance_cents - ctx.reserved_cents
        : ctx.user.free_allowance_cents;

    if (!group.has_value() || !user_id.has_value()) return ctx;

    const auto conversation = store_->conversation(group->conversation_id);
    if (!conversation.has_value()) {
        throw ConversationNotFoundException(group->conversation_id);
    }
    const auto member = store_->member(group->member_id);
    if (!member.has_value() || member->conversation_id != group->conversation_id) {
        throw MemberNotFoundException(group->member_id);
    }

    GroupFunding funding;
    funding.scope = GroupReservationScope{group->conversation_id, group->member_id, group->owner_id};
    funding.owner = user_tier_info(group->owner_id, now);

    const MemberBudgetRow member_budget = store_->member_budget(group->member_id)
        .value_or(MemberBudgetRow{group->member_id, 0, 0});
    const MoneyUnits conversation_spent = store_->conversation_spending(group->conversation_id);

    GroupBudgetInput input;
    input.conversation_budget = conversation->conversation_budget;
    input.conversation_spent = conversation_spent;
    input.member_budget = member_budget.budget;
    input.member_spent = member_budget.spent;
    input.owner_balance_cents = funding.owner.balance_cents;
    input.reserved = ledger_->group_reserved_totals(funding.scope);

    funding.remaining = compute_group_remaining(input);
    funding.effective_cents = effective_budget_cents(funding.remaining.conversation_remaining_cents,
                                                     funding.remaining.member_remaining_cents,
                                                     funding.remaining.owner_remaining_cents);

    funding.ceilings.member_ceiling = units_to_cents(member_budget.budget - member_budget.spent);
    funding.ceilings.conversation_ceiling =
        units_to_cents(conversation->conversation_budget - conversation_spent);
    funding.ceilings.payer_ceiling = funding.owner.balance_cents;

    ctx.group = funding;
    return ctx;
}

BillingDecision FundingResolver::resolve(const BillingContext& context, bool is_premium_model,
                                         Cents estimated_minimum_cost_cents) {
    const BillingDecision decision = resolve_billing(
        to_resolve_input(context, is_premium_model, estimated_minimum_cost_cents), config_.budget);

    if (decision.denied()) {
        emit_event(EventType::BillingDenied, to_string(decision.denial.value()),
                   context.user_id, estimated_minimum_cost_cents);
    }
    return decision;
}

void FundingResolver::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void FundingResolver::emit_event(EventType type, const std::string& message,
                                 std::optional<UserId> user_id,
                                 std::optional<Cents> amount_cents) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.user_id = std::move(user_id);
    event.amount_cents = amount_cents;

    monitor->on_event(event);
}

} // namespace spendguard
