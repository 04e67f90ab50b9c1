#include <gtest/gtest.h>
#include <spendguard/spendguard.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

using namespace spendguard;
using namespace std::chrono_literals;

// ===========================================================================
// Many requests racing for one balance: reservations never exceed the ceiling
// ===========================================================================

TEST(ConcurrentReservationsTest, HeldReservationsNeverExceedCeiling) {
    constexpr int NUM_REQUESTS = 20;
    constexpr Cents AMOUNT = 7.0;
    constexpr Cents CEILING = 100.0;

    auto ledger = std::make_shared<ReservationLedger>(std::make_shared<InMemoryCounterStore>());

    std::mutex mutex;
    std::condition_variable cv;
    int finished_attempts = 0;
    std::atomic<int> granted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&]() {
            ReservationGuard guard;
            try {
                guard = ledger->reserve_checked("user", AMOUNT, CEILING);
                granted++;
            } catch (const BalanceReservedException&) {
                rejected++;
            } catch (const std::exception&) {
                errors++;
            }

            // Hold every grant until all requests have attempted
            std::unique_lock<std::mutex> lock(mutex);
            finished_attempts++;
            cv.notify_all();
            cv.wait_for(lock, 5s, [&] { return finished_attempts == NUM_REQUESTS; });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(granted.load() + rejected.load(), NUM_REQUESTS);
    EXPECT_GE(granted.load(), 1);
    EXPECT_LE(granted.load() * AMOUNT, CEILING + 1e-6);
    EXPECT_DOUBLE_EQ(ledger->reserved_total("user"), 0.0);
}

TEST(ConcurrentReservationsTest, RandomReserveReleaseCyclesBalanceOut) {
    constexpr int NUM_THREADS = 8;
    constexpr int OPS_PER_THREAD = 50;
    constexpr Cents CEILING = 50.0;

    auto counters = std::make_shared<InMemoryCounterStore>();
    auto ledger = std::make_shared<ReservationLedger>(counters);
    auto metrics = std::make_shared<MetricsMonitor>();
    ledger->set_monitor(metrics);

    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            std::mt19937 rng(static_cast<unsigned>(i * 42 + 7));
            // Half-cent steps keep the counter sums exact
            std::uniform_int_distribution<int> half_cents(1, 19);

            for (int op = 0; op < OPS_PER_THREAD; ++op) {
                try {
                    auto guard = ledger->reserve_checked("user", half_cents(rng) * 0.5, CEILING);
                    std::this_thread::yield();
                } catch (const BalanceReservedException&) {
                    // expected under contention
                } catch (const std::exception&) {
                    errors++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_TRUE(counters->entries().empty());

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.reservations, m.releases);
    EXPECT_EQ(m.reservations + m.race_rejections,
              static_cast<std::uint64_t>(NUM_THREADS * OPS_PER_THREAD));
}

TEST(ConcurrentReservationsTest, GroupReservationsRespectMemberBudget) {
    constexpr int NUM_REQUESTS = 12;
    constexpr Cents AMOUNT = 10.0;

    auto ledger = std::make_shared<ReservationLedger>(std::make_shared<InMemoryCounterStore>());
    const GroupCeilings ceilings{45.0, 1000.0, 1000.0};
    const GroupReservationScope scope{"conv", "member", "owner"};

    std::mutex mutex;
    std::condition_variable cv;
    int finished_attempts = 0;
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&]() {
            ReservationGuard guard;
            try {
                guard = ledger->reserve_group_checked(scope, AMOUNT, ceilings);
                granted++;
            } catch (const BalanceReservedException&) {
                // member budget exhausted by the others
            }

            std::unique_lock<std::mutex> lock(mutex);
            finished_attempts++;
            cv.notify_all();
            cv.wait_for(lock, 5s, [&] { return finished_attempts == NUM_REQUESTS; });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_GE(granted.load(), 1);
    EXPECT_LE(granted.load(), 4);
    auto totals = ledger->group_reserved_totals(scope);
    EXPECT_DOUBLE_EQ(totals.member_total, 0.0);
    EXPECT_DOUBLE_EQ(totals.conversation_total, 0.0);
    EXPECT_DOUBLE_EQ(totals.payer_total, 0.0);
}
