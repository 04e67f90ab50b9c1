#include "spendguard/guest_quota.hpp"
#include "spendguard/exceptions.hpp"

#include <utility>

namespace spendguard {

GuestQuota::GuestQuota(AllowanceConfig config)
    : config_(std::move(config))
{}

std::optional<std::size_t> GuestQuota::find_highest(const std::optional<std::string>& guest_token,
                                                    const std::string& ip_hash) const {
    std::optional<std::size_t> highest;
    auto consider = [&](std::size_t i) {
        if (!highest.has_value() || records_[i].message_count > records_[highest.value()].message_count) {
            highest = i;
        }
    };

    if (guest_token.has_value()) {
        auto range = by_token_.equal_range(guest_token.value());
        for (auto it = range.first; it != range.second; ++it) consider(it->second);
    }
    auto range = by_ip_.equal_range(ip_hash);
    for (auto it = range.first; it != range.second; ++it) consider(it->second);
    return highest;
}

void GuestQuota::roll_over(WallTime now) {
    const WallTime today = utc_day_start(now);
    if (current_day_.has_value() && today <= current_day_.value()) return;

    records_.clear();
    by_token_.clear();
    by_ip_.clear();
    current_day_ = today;
}

bool GuestQuota::needs_reset(const Record& r, WallTime now) {
    return !r.reset_at.has_value() || r.reset_at.value() < utc_day_start(now);
}

GuestQuotaStatus GuestQuota::check(const std::optional<std::string>& guest_token,
                                   const std::string& ip_hash,
                                   WallTime now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    GuestQuotaStatus status;
    status.limit = config_.guest_daily_message_limit;

    const auto index = find_highest(guest_token, ip_hash);
    if (index.has_value() && !needs_reset(records_[index.value()], now)) {
        status.message_count = records_[index.value()].message_count;
    }
    status.can_send = status.message_count < status.limit;
    return status;
}

void GuestQuota::require_available(const std::optional<std::string>& guest_token,
                                   const std::string& ip_hash,
                                   WallTime now) const {
    const GuestQuotaStatus status = check(guest_token, ip_hash, now);
    if (!status.can_send) {
        throw GuestQuotaExceededException(status.message_count, status.limit);
    }
}

std::int64_t GuestQuota::record_message(const std::optional<std::string>& guest_token,
                                        const std::string& ip_hash,
                                        WallTime now) {
    std::int64_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_over(now);

        const auto index = find_highest(guest_token, ip_hash);
        if (!index.has_value()) {
            const std::size_t i = records_.size();
            records_.push_back(Record{guest_token, ip_hash, 1, utc_day_start(now)});
            if (guest_token.has_value()) by_token_.emplace(guest_token.value(), i);
            by_ip_.emplace(ip_hash, i);
            count = 1;
        } else {
            Record& record = records_[index.value()];
            if (needs_reset(record, now)) {
                record.message_count = 1;
                record.reset_at = utc_day_start(now);
            } else {
                record.message_count++;
            }
            count = record.message_count;
        }
    }

    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        MonitorEvent event;
        event.type = EventType::GuestMessageCounted;
        event.timestamp = Clock::now();
        event.message = "Guest message " + std::to_string(count) + " of " +
                        std::to_string(config_.guest_daily_message_limit);
        monitor->on_event(event);
    }
    return count;
}

std::size_t GuestQuota::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void GuestQuota::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

} // namespace spendguard
