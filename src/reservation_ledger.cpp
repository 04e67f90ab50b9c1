#include "spendguard/reservation_ledger.hpp"
#include "spendguard/exceptions.hpp"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <utility>

namespace spendguard {

// ========== ReservationGuard ==========

ReservationGuard::ReservationGuard(ReservationLedger* ledger, UserId user_id, Cents amount)
    : ledger_(ledger)
    , user_id_(std::move(user_id))
    , amount_(amount)
    , active_(true)
{}

ReservationGuard::ReservationGuard(ReservationLedger* ledger, GroupReservationScope scope, Cents amount)
    : ledger_(ledger)
    , group_(std::move(scope))
    , amount_(amount)
    , active_(true)
{}

ReservationGuard::~ReservationGuard() {
    release_on_destroy();
}

ReservationGuard::ReservationGuard(ReservationGuard&& other) noexcept
    : ledger_(other.ledger_)
    , user_id_(std::move(other.user_id_))
    , group_(std::move(other.group_))
    , amount_(other.amount_)
    , active_(other.active_)
{
    other.active_ = false;
}

ReservationGuard& ReservationGuard::operator=(ReservationGuard&& other) noexcept {
    if (this != &other) {
        release_on_destroy();
        ledger_ = other.ledger_;
        user_id_ = std::move(other.user_id_);
        group_ = std::move(other.group_);
        amount_ = other.amount_;
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void ReservationGuard::release() {
    if (!active_ || ledger_ == nullptr) return;
    active_ = false;
    if (group_.has_value()) {
        ledger_->release_group(group_.value(), amount_);
    } else if (user_id_.has_value()) {
        ledger_->release(user_id_.value(), amount_);
    }
}

void ReservationGuard::release_on_destroy() noexcept {
    if (!active_) return;
    try {
        release();
    } catch (const std::exception& e) {
        // The counter keys expire after their TTL, so the amount is not lost for good
        ledger_->emit_event(EventType::ReleaseFailed,
                            std::string("Release failed, waiting for key expiry: ") + e.what(),
                            user_id_, amount_, group_.has_value() ? &group_.value() : nullptr);
    }
}

// ========== ReservationLedger ==========

ReservationLedger::ReservationLedger(std::shared_ptr<CounterStore> store, ReservationConfig config)
    : store_(std::move(store))
    , config_(std::move(config))
{
    if (!store_) {
        throw std::invalid_argument("ReservationLedger requires a counter store");
    }
}

std::string ReservationLedger::user_key(const UserId& user_id) const {
    return config_.key_prefix + ":reserved:" + user_id;
}

std::string ReservationLedger::member_key(const ConversationId& conversation_id,
                                          const MemberId& member_id) const {
    return config_.key_prefix + ":group-reserved:" + conversation_id + ":" + member_id;
}

std::string ReservationLedger::conversation_key(const ConversationId& conversation_id) const {
    return config_.key_prefix + ":conversation-reserved:" + conversation_id;
}

Cents ReservationLedger::reserve(const UserId& user_id, Cents amount) {
    return store_->increment(user_key(user_id), amount, config_.key_ttl);
}

void ReservationLedger::release(const UserId& user_id, Cents amount) {
    store_->increment(user_key(user_id), -amount, config_.key_ttl);
    emit_event(EventType::ReservationReleased, "Reservation released", user_id, amount);
}

std::vector<std::string> ReservationLedger::group_keys(const GroupReservationScope& scope) const {
    return {member_key(scope.conversation_id, scope.member_id),
            conversation_key(scope.conversation_id),
            user_key(scope.payer_id)};
}

std::vector<Cents> ReservationLedger::increment_all(const std::vector<std::string>& keys, Cents amount) {
    std::vector<Cents> totals;
    totals.reserve(keys.size());
    try {
        for (const auto& key : keys) {
            totals.push_back(store_->increment(key, amount, config_.key_ttl));
        }
    } catch (...) {
        // Put back the keys that were already incremented
        const auto applied = keys.begin() + static_cast<std::ptrdiff_t>(totals.size());
        decrement_each(std::vector<std::string>(keys.begin(), applied), amount);
        throw;
    }
    return totals;
}

void ReservationLedger::decrement_each(const std::vector<std::string>& keys, Cents amount) {
    for (const auto& key : keys) {
        try {
            store_->increment(key, -amount, config_.key_ttl);
        } catch (const std::exception& e) {
            emit_event(EventType::ReleaseFailed,
                       "Release of " + key + " failed, waiting for key expiry: " + e.what(),
                       std::nullopt, amount);
        }
    }
}

GroupReservedTotals ReservationLedger::reserve_group(const GroupReservationScope& scope, Cents amount) {
    const std::vector<Cents> totals = increment_all(group_keys(scope), amount);
    GroupReservedTotals result;
    result.member_total = totals[0];
    result.conversation_total = totals[1];
    result.payer_total = totals[2];
    return result;
}

void ReservationLedger::release_group(const GroupReservationScope& scope, Cents amount) {
    // Every key is attempted; the first failure is rethrown afterwards
    std::exception_ptr first_error;
    for (const auto& key : group_keys(scope)) {
        try {
            store_->increment(key, -amount, config_.key_ttl);
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    emit_event(EventType::ReservationReleased, "Group reservation released",
               scope.payer_id, amount, &scope);
}

Cents ReservationLedger::reserved_total(const UserId& user_id) const {
    return store_->get(user_key(user_id));
}

GroupReservedTotals ReservationLedger::group_reserved_totals(const GroupReservationScope& scope) const {
    GroupReservedTotals totals;
    totals.member_total = store_->get(member_key(scope.conversation_id, scope.member_id));
    totals.conversation_total = store_->get(conversation_key(scope.conversation_id));
    totals.payer_total = store_->get(user_key(scope.payer_id));
    return totals;
}

// ==================== Race-guarded reservations ====================

bool ReservationLedger::exceeds(Cents total, Cents ceiling) const noexcept {
    return total > ceiling + config_.race_check_tolerance_cents;
}

ReservationGuard ReservationLedger::reserve_checked(const UserId& user_id, Cents amount,
                                                    Cents ceiling_cents) {
    const Cents new_total = reserve(user_id, amount);

    if (exceeds(new_total, ceiling_cents)) {
        store_->increment(user_key(user_id), -amount, config_.key_ttl);
        emit_event(EventType::ReservationRejected,
                   "New total " + std::to_string(new_total) + " exceeds ceiling " +
                   std::to_string(ceiling_cents),
                   user_id, amount);
        throw BalanceReservedException(new_total, ceiling_cents);
    }

    emit_event(EventType::ReservationCreated, "Reservation created", user_id, amount);
    return ReservationGuard(this, user_id, amount);
}

ReservationGuard ReservationLedger::reserve_group_checked(const GroupReservationScope& scope,
                                                          Cents amount,
                                                          const GroupCeilings& ceilings) {
    const GroupReservedTotals totals = reserve_group(scope, amount);

    std::optional<std::pair<Cents, Cents>> overflow;
    if (exceeds(totals.member_total, ceilings.member_ceiling)) {
        overflow = std::make_pair(totals.member_total, ceilings.member_ceiling);
    } else if (exceeds(totals.conversation_total, ceilings.conversation_ceiling)) {
        overflow = std::make_pair(totals.conversation_total, ceilings.conversation_ceiling);
    } else if (exceeds(totals.payer_total, ceilings.payer_ceiling)) {
        overflow = std::make_pair(totals.payer_total, ceilings.payer_ceiling);
    }

    if (overflow.has_value()) {
        decrement_each(group_keys(scope), amount);
        emit_event(EventType::ReservationRejected,
                   "Group total " + std::to_string(overflow->first) + " exceeds ceiling " +
                   std::to_string(overflow->second),
                   scope.payer_id, amount, &scope);
        throw BalanceReservedException(overflow->first, overflow->second);
    }

    emit_event(EventType::ReservationCreated, "Group reservation created",
               scope.payer_id, amount, &scope);
    return ReservationGuard(this, scope, amount);
}

// ==================== Monitoring ====================

LedgerSnapshot ReservationLedger::snapshot() const {
    LedgerSnapshot snap;
    snap.timestamp = Clock::now();
    snap.outstanding = store_->entries();
    // Group payer reservations live under the user key, so only user keys are summed
    const std::string user_prefix = config_.key_prefix + ":reserved:";
    for (auto& [key, cents] : snap.outstanding) {
        if (key.compare(0, user_prefix.size(), user_prefix) == 0) {
            snap.total_outstanding += cents;
        }
    }
    return snap;
}

LedgerSnapshot ReservationLedger::publish_snapshot() {
    LedgerSnapshot snap = snapshot();
    if (auto monitor = current_monitor()) monitor->on_snapshot(snap);
    return snap;
}

void ReservationLedger::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

std::shared_ptr<Monitor> ReservationLedger::current_monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

void ReservationLedger::emit_event(EventType type, const std::string& message,
                                   std::optional<UserId> user_id,
                                   std::optional<Cents> amount_cents,
                                   const GroupReservationScope* scope) {
    auto monitor = current_monitor();
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.user_id = std::move(user_id);
    event.amount_cents = amount_cents;
    if (scope != nullptr) {
        event.conversation_id = scope->conversation_id;
        event.member_id = scope->member_id;
        event.funding_source = FundingSource::OwnerBalance;
    }

    monitor->on_event(event);
}

} // namespace spendguard
