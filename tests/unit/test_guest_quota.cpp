#include <gtest/gtest.h>
#include <spendguard/spendguard.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace spendguard;
using namespace std::chrono_literals;

class GuestQuotaTest : public ::testing::Test {
protected:
    GuestQuota quota;
    const WallTime morning = WallTime{} + std::chrono::hours(24 * 20000 + 8);

    void send(int n, const std::optional<std::string>& token, const std::string& ip,
              WallTime at) {
        for (int i = 0; i < n; ++i) quota.record_message(token, ip, at);
    }
};

// ===========================================================================
// Counting
// ===========================================================================

TEST_F(GuestQuotaTest, FreshGuestCanSend) {
    auto status = quota.check(std::string("tok"), "ip-1", morning);
    EXPECT_TRUE(status.can_send);
    EXPECT_EQ(status.message_count, 0);
    EXPECT_EQ(status.limit, 5);
}

TEST_F(GuestQuotaTest, RecordIncrementsCount) {
    EXPECT_EQ(quota.record_message(std::string("tok"), "ip-1", morning), 1);
    EXPECT_EQ(quota.record_message(std::string("tok"), "ip-1", morning + 1h), 2);
    EXPECT_EQ(quota.check(std::string("tok"), "ip-1", morning + 2h).message_count, 2);
    EXPECT_EQ(quota.record_count(), 1u);
}

TEST_F(GuestQuotaTest, LimitReachedBlocksSending) {
    send(5, std::string("tok"), "ip-1", morning);

    auto status = quota.check(std::string("tok"), "ip-1", morning);
    EXPECT_FALSE(status.can_send);
    EXPECT_EQ(status.message_count, 5);

    try {
        quota.require_available(std::string("tok"), "ip-1", morning);
        FAIL() << "expected GuestQuotaExceededException";
    } catch (const GuestQuotaExceededException& e) {
        EXPECT_EQ(e.message_count(), 5);
        EXPECT_EQ(e.limit(), 5);
    }
}

TEST_F(GuestQuotaTest, ConfiguredLimit) {
    AllowanceConfig cfg;
    cfg.guest_daily_message_limit = 2;
    GuestQuota strict(cfg);

    strict.record_message(std::nullopt, "ip-1", morning);
    EXPECT_NO_THROW(strict.require_available(std::nullopt, "ip-1", morning));
    strict.record_message(std::nullopt, "ip-1", morning);
    EXPECT_THROW(strict.require_available(std::nullopt, "ip-1", morning), GuestQuotaExceededException);
}

// ===========================================================================
// Identity matching
// ===========================================================================

TEST_F(GuestQuotaTest, ClearedTokenStillMatchesIp) {
    send(5, std::string("tok"), "ip-1", morning);
    EXPECT_FALSE(quota.check(std::nullopt, "ip-1", morning).can_send);
    EXPECT_FALSE(quota.check(std::string("new-token"), "ip-1", morning).can_send);
}

TEST_F(GuestQuotaTest, SameTokenOnNewIpStillMatches) {
    send(5, std::string("tok"), "ip-1", morning);
    EXPECT_FALSE(quota.check(std::string("tok"), "ip-2", morning).can_send);
}

TEST_F(GuestQuotaTest, HighestMatchingCountWins) {
    send(2, std::string("tok-a"), "ip-1", morning);
    send(4, std::string("tok-b"), "ip-2", morning);

    // tok-a on ip-2 matches both records
    EXPECT_EQ(quota.check(std::string("tok-a"), "ip-2", morning).message_count, 4);
    EXPECT_EQ(quota.record_message(std::string("tok-a"), "ip-2", morning), 5);
    EXPECT_EQ(quota.record_count(), 2u);
}

TEST_F(GuestQuotaTest, UnrelatedGuestsAreIndependent) {
    send(5, std::string("tok-a"), "ip-1", morning);
    EXPECT_TRUE(quota.check(std::string("tok-b"), "ip-2", morning).can_send);
}

// ===========================================================================
// Daily reset
// ===========================================================================

TEST_F(GuestQuotaTest, CountResetsAtUtcMidnight) {
    send(5, std::string("tok"), "ip-1", morning);

    const WallTime tomorrow = morning + 24h;
    auto status = quota.check(std::string("tok"), "ip-1", tomorrow);
    EXPECT_TRUE(status.can_send);
    EXPECT_EQ(status.message_count, 0);

    EXPECT_EQ(quota.record_message(std::string("tok"), "ip-1", tomorrow), 1);
}

TEST_F(GuestQuotaTest, LateNightAndEarlyMorningAreDifferentDays) {
    const WallTime late = WallTime{} + std::chrono::hours(24 * 20000 + 23) + 59min;
    send(5, std::string("tok"), "ip-1", late);

    EXPECT_FALSE(quota.check(std::string("tok"), "ip-1", late + 30s).can_send);
    EXPECT_TRUE(quota.check(std::string("tok"), "ip-1", late + 2min).can_send);
}

TEST_F(GuestQuotaTest, PastDaysAreDroppedOnRollover) {
    send(2, std::string("tok-a"), "ip-1", morning);
    send(2, std::string("tok-b"), "ip-2", morning);
    send(2, std::nullopt, "ip-3", morning);
    EXPECT_EQ(quota.record_count(), 3u);

    const WallTime tomorrow = morning + 24h;
    EXPECT_EQ(quota.record_message(std::string("tok-a"), "ip-1", tomorrow), 1);
    EXPECT_EQ(quota.record_count(), 1u);
    EXPECT_EQ(quota.check(std::string("tok-b"), "ip-2", tomorrow).message_count, 0);
}

TEST_F(GuestQuotaTest, RecordsStayBoundedAcrossManyDays) {
    for (int day = 0; day < 30; ++day) {
        const WallTime at = morning + std::chrono::hours(24 * day);
        for (int g = 0; g < 10; ++g) {
            quota.record_message("tok-" + std::to_string(day) + "-" + std::to_string(g),
                                 "ip-" + std::to_string(g), at);
        }
        EXPECT_EQ(quota.record_count(), 10u);
    }
}

// ===========================================================================
// Concurrency and monitoring
// ===========================================================================

TEST_F(GuestQuotaTest, ConcurrentRecordsAreCounted) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] { send(25, std::string("tok"), "ip-1", morning); });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(quota.check(std::string("tok"), "ip-1", morning).message_count, 100);
    EXPECT_EQ(quota.record_count(), 1u);
}

TEST_F(GuestQuotaTest, MonitorSeesEveryCountedMessage) {
    class Counter : public Monitor {
    public:
        int counted = 0;
        void on_event(const MonitorEvent& e) override {
            if (e.type == EventType::GuestMessageCounted) ++counted;
        }
        void on_snapshot(const LedgerSnapshot&) override {}
    };
    auto counter = std::make_shared<Counter>();
    quota.set_monitor(counter);

    send(3, std::nullopt, "ip-1", morning);
    EXPECT_EQ(counter->counted, 3);
}
