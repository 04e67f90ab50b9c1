#include "spendguard/monitor.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace spendguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::BudgetCalculated:     return "BudgetCalculated";
        case EventType::BillingDenied:        return "BillingDenied";
        case EventType::ReservationCreated:   return "ReservationCreated";
        case EventType::ReservationRejected:  return "ReservationRejected";
        case EventType::ReservationReleased:  return "ReservationReleased";
        case EventType::ReleaseFailed:        return "ReleaseFailed";
        case EventType::SettlementCommitted:  return "SettlementCommitted";
        case EventType::SettlementRolledBack: return "SettlementRolledBack";
        case EventType::UserMessageSaved:     return "UserMessageSaved";
        case EventType::FreeAllowanceRenewed: return "FreeAllowanceRenewed";
        case EventType::CapacityRetry:        return "CapacityRetry";
        case EventType::CapacityTooLow:       return "CapacityTooLow";
        case EventType::InferenceFailed:      return "InferenceFailed";
        case EventType::GuestMessageCounted:  return "GuestMessageCounted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::BillingDenied:
        case EventType::ReservationRejected:
        case EventType::ReleaseFailed:
        case EventType::SettlementRolledBack:
        case EventType::FreeAllowanceRenewed:
        case EventType::CapacityRetry:
        case EventType::CapacityTooLow:
        case EventType::InferenceFailed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[SpendGuard] " << to_string(event.type);

    if (event.user_id.has_value()) {
        std::cout << " user=" << event.user_id.value();
    }
    if (event.conversation_id.has_value()) {
        std::cout << " conversation=" << event.conversation_id.value();
    }
    if (event.member_id.has_value()) {
        std::cout << " member=" << event.member_id.value();
    }
    if (event.funding_source.has_value()) {
        std::cout << " source=" << to_string(event.funding_source.value());
    }
    if (event.amount_cents.has_value()) {
        std::cout << " cents=" << std::fixed << std::setprecision(6)
                  << event.amount_cents.value() << std::defaultfloat;
    }
    if (event.tokens.has_value()) {
        std::cout << " tokens=" << event.tokens.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const LedgerSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[SpendGuard] === Reservation Snapshot ===\n";
    std::cout << "  Keys: " << snapshot.outstanding.size() << "\n";
    std::cout << "  Outstanding: " << std::fixed << std::setprecision(4)
              << snapshot.total_outstanding << " cents\n";

    if (verbosity_ == Verbosity::Debug) {
        for (auto& [key, cents] : snapshot.outstanding) {
            std::cout << "    " << key << " = " << cents << "\n";
        }
    }
    std::cout << std::defaultfloat << "  ============================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::string alert;
    AlertCallback cb;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        const Cents amount = event.amount_cents.value_or(0.0);

        switch (event.type) {
            case EventType::BudgetCalculated:
                metrics_.budgets_calculated++;
                break;
            case EventType::BillingDenied:
                metrics_.denials++;
                break;
            case EventType::ReservationCreated:
                metrics_.reservations++;
                metrics_.outstanding_cents += amount;
                metrics_.peak_outstanding_cents =
                    std::max(metrics_.peak_outstanding_cents, metrics_.outstanding_cents);
                if (outstanding_cb_ && outstanding_threshold_ > 0.0 &&
                    metrics_.outstanding_cents > outstanding_threshold_) {
                    alert = "Outstanding reservations " +
                            std::to_string(metrics_.outstanding_cents) +
                            " cents exceed threshold";
                    cb = outstanding_cb_;
                }
                break;
            case EventType::ReservationRejected:
                metrics_.race_rejections++;
                break;
            case EventType::ReservationReleased:
                metrics_.releases++;
                metrics_.outstanding_cents = std::max(0.0, metrics_.outstanding_cents - amount);
                break;
            case EventType::SettlementCommitted:
                metrics_.settlements++;
                metrics_.total_settled_cents += amount;
                break;
            case EventType::SettlementRolledBack:
                metrics_.rollbacks++;
                break;
            case EventType::CapacityRetry:
                metrics_.capacity_retries++;
                break;
            case EventType::CapacityTooLow:
                metrics_.capacity_failures++;
                break;
            case EventType::FreeAllowanceRenewed:
                metrics_.renewals++;
                break;
            default:
                break;
        }
    }

    // Invoke outside the lock so the callback may query metrics
    if (cb) cb(alert);
}

void MetricsMonitor::on_snapshot(const LedgerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.outstanding_cents = snapshot.total_outstanding;
    metrics_.peak_outstanding_cents =
        std::max(metrics_.peak_outstanding_cents, snapshot.total_outstanding);
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_outstanding_alert_threshold(Cents threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    outstanding_threshold_ = threshold;
    outstanding_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const LedgerSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace spendguard
