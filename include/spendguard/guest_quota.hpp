#pragma once

#include "spendguard/config.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spendguard {

struct GuestQuotaStatus {
    bool can_send{true};
    std::int64_t message_count{0};
    std::int64_t limit{0};
};

// Daily message counter for unauthenticated guests, keyed by guest token
// and IP hash. Counters reset at UTC midnight.
class GuestQuota {
public:
    explicit GuestQuota(AllowanceConfig config = AllowanceConfig{});

    GuestQuota(const GuestQuota&) = delete;
    GuestQuota& operator=(const GuestQuota&) = delete;

    // Current count for today. When several records match (same token on a
    // new IP, or a cleared token on a known IP) the highest count wins.
    GuestQuotaStatus check(const std::optional<std::string>& guest_token,
                           const std::string& ip_hash,
                           WallTime now = WallClock::now()) const;

    // Throws GuestQuotaExceededException when today's limit is reached
    void require_available(const std::optional<std::string>& guest_token,
                           const std::string& ip_hash,
                           WallTime now = WallClock::now()) const;

    // Counts one sent message; returns the new count for today
    std::int64_t record_message(const std::optional<std::string>& guest_token,
                                const std::string& ip_hash,
                                WallTime now = WallClock::now());

    // Records kept for the current UTC day
    std::size_t record_count() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct Record {
        std::optional<std::string> guest_token;
        std::string ip_hash;
        std::int64_t message_count{0};
        std::optional<WallTime> reset_at;
    };

    AllowanceConfig config_;
    mutable std::mutex mutex_;

    // Records of the current UTC day only; older days are dropped on rollover
    std::optional<WallTime> current_day_;
    std::vector<Record> records_;
    std::unordered_multimap<std::string, std::size_t> by_token_;
    std::unordered_multimap<std::string, std::size_t> by_ip_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    // Caller holds mutex_
    std::optional<std::size_t> find_highest(const std::optional<std::string>& guest_token,
                                            const std::string& ip_hash) const;
    void roll_over(WallTime now);
    static bool needs_reset(const Record& r, WallTime now);
};

} // namespace spendguard
