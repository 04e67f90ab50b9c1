#pragma once

#include "spendguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spendguard {

enum class EventType {
    BudgetCalculated,
    BillingDenied,
    ReservationCreated,
    ReservationRejected,
    ReservationReleased,
    ReleaseFailed,
    SettlementCommitted,
    SettlementRolledBack,
    UserMessageSaved,
    FreeAllowanceRenewed,
    CapacityRetry,
    CapacityTooLow,
    InferenceFailed,
    GuestMessageCounted
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<UserId> user_id;
    std::optional<ConversationId> conversation_id;
    std::optional<MemberId> member_id;
    std::optional<FundingSource> funding_source;

    // Money involved, in fractional cents (reservation size, settled cost, ...)
    std::optional<Cents> amount_cents;

    // Token figures (max output tokens, corrected ceiling, ...)
    std::optional<std::int64_t> tokens;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const LedgerSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const LedgerSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t budgets_calculated{0};
        std::uint64_t denials{0};
        std::uint64_t reservations{0};
        std::uint64_t releases{0};
        std::uint64_t race_rejections{0};
        std::uint64_t settlements{0};
        std::uint64_t rollbacks{0};
        std::uint64_t capacity_retries{0};
        std::uint64_t capacity_failures{0};
        std::uint64_t renewals{0};
        Cents total_settled_cents{0.0};
        Cents outstanding_cents{0.0};
        Cents peak_outstanding_cents{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const LedgerSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_outstanding_alert_threshold(Cents threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    Cents outstanding_threshold_{0.0};
    AlertCallback outstanding_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const LedgerSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace spendguard
