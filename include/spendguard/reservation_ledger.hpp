#pragma once

#include "spendguard/config.hpp"
#include "spendguard/counter_store.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spendguard {

// The three counters touched by an owner-funded group call
struct GroupReservationScope {
    ConversationId conversation_id;
    MemberId member_id;
    UserId payer_id;
};

struct GroupReservedTotals {
    Cents member_total{0.0};
    Cents conversation_total{0.0};
    Cents payer_total{0.0};
};

// Race-check ceilings per group scope, in cents, before subtracting reservations
struct GroupCeilings {
    Cents member_ceiling{0.0};
    Cents conversation_ceiling{0.0};
    Cents payer_ceiling{0.0};
};

class ReservationLedger;

// Scoped reservation: released exactly once, on destruction at the latest.
class ReservationGuard {
public:
    ReservationGuard() = default;
    ~ReservationGuard();

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    ReservationGuard(ReservationGuard&& other) noexcept;
    ReservationGuard& operator=(ReservationGuard&& other) noexcept;

    // Releases now. Later calls are no-ops.
    void release();

    bool active() const noexcept { return active_; }
    Cents amount() const noexcept { return amount_; }

private:
    friend class ReservationLedger;

    ReservationGuard(ReservationLedger* ledger, UserId user_id, Cents amount);
    ReservationGuard(ReservationLedger* ledger, GroupReservationScope scope, Cents amount);

    void release_on_destroy() noexcept;

    ReservationLedger* ledger_{nullptr};
    std::optional<UserId> user_id_;
    std::optional<GroupReservationScope> group_;
    Cents amount_{0.0};
    bool active_{false};
};

class ReservationLedger {
public:
    explicit ReservationLedger(std::shared_ptr<CounterStore> store,
                               ReservationConfig config = ReservationConfig{});

    ReservationLedger(const ReservationLedger&) = delete;
    ReservationLedger& operator=(const ReservationLedger&) = delete;

    // ==================== Keys ====================

    std::string user_key(const UserId& user_id) const;
    std::string member_key(const ConversationId& conversation_id, const MemberId& member_id) const;
    std::string conversation_key(const ConversationId& conversation_id) const;

    // ==================== Raw counters ====================

    // Returns the new total for the user
    Cents reserve(const UserId& user_id, Cents amount);
    void release(const UserId& user_id, Cents amount);

    // Member, conversation, then payer. The payer key is the personal user key.
    GroupReservedTotals reserve_group(const GroupReservationScope& scope, Cents amount);
    void release_group(const GroupReservationScope& scope, Cents amount);

    Cents reserved_total(const UserId& user_id) const;
    GroupReservedTotals group_reserved_totals(const GroupReservationScope& scope) const;

    // ==================== Race-guarded reservations ====================

    // Reserve, then re-validate the returned total against the ceiling.
    // On overflow the reservation is rolled back and BalanceReservedException thrown.
    ReservationGuard reserve_checked(const UserId& user_id, Cents amount, Cents ceiling_cents);
    ReservationGuard reserve_group_checked(const GroupReservationScope& scope, Cents amount,
                                           const GroupCeilings& ceilings);

    // ==================== Monitoring ====================

    LedgerSnapshot snapshot() const;

    // Takes a snapshot and hands it to the monitor, if one is attached
    LedgerSnapshot publish_snapshot();

    void set_monitor(std::shared_ptr<Monitor> monitor);

    const ReservationConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CounterStore> store_;
    ReservationConfig config_;
    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    bool exceeds(Cents total, Cents ceiling) const noexcept;
    std::shared_ptr<Monitor> current_monitor() const;

    // Member, conversation, payer
    std::vector<std::string> group_keys(const GroupReservationScope& scope) const;
    // All keys or none: a failed increment undoes the ones before it
    std::vector<Cents> increment_all(const std::vector<std::string>& keys, Cents amount);
    // Failures are reported to the monitor; the keys expire after their TTL
    void decrement_each(const std::vector<std::string>& keys, Cents amount);
    void emit_event(EventType type, const std::string& message,
                    std::optional<UserId> user_id = std::nullopt,
                    std::optional<Cents> amount_cents = std::nullopt,
                    const GroupReservationScope* scope = nullptr);

    friend class ReservationGuard;
};

} // namespace spendguard
