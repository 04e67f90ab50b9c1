#include <gtest/gtest.h>
#include <spendguard/spendguard.hpp>

#include <thread>
#include <vector>

using namespace spendguard;
using namespace std::chrono_literals;

class CounterStoreTest : public ::testing::Test {
protected:
    InMemoryCounterStore store;
    const Duration ttl = std::chrono::seconds(180);
};

// ===========================================================================
// Increment semantics
// ===========================================================================

TEST_F(CounterStoreTest, IncrementReturnsNewTotal) {
    EXPECT_DOUBLE_EQ(store.increment("k", 2.5, ttl), 2.5);
    EXPECT_DOUBLE_EQ(store.increment("k", 1.25, ttl), 3.75);
    EXPECT_DOUBLE_EQ(store.get("k"), 3.75);
}

TEST_F(CounterStoreTest, MissingKeyReadsZero) {
    EXPECT_DOUBLE_EQ(store.get("missing"), 0.0);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(CounterStoreTest, DecrementToZeroDeletesKey) {
    store.increment("k", 5.0, ttl);
    EXPECT_DOUBLE_EQ(store.increment("k", -5.0, ttl), 0.0);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(CounterStoreTest, NegativeResultIsClampedAndDeleted) {
    store.increment("k", 1.0, ttl);
    EXPECT_DOUBLE_EQ(store.increment("k", -3.0, ttl), 0.0);
    EXPECT_EQ(store.entries().count("k"), 0u);

    // A stray release on a missing key never creates a negative counter
    EXPECT_DOUBLE_EQ(store.increment("other", -1.0, ttl), 0.0);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(CounterStoreTest, KeysAreIndependent) {
    store.increment("a", 1.0, ttl);
    store.increment("b", 2.0, ttl);

    auto all = store.entries();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_DOUBLE_EQ(all["a"], 1.0);
    EXPECT_DOUBLE_EQ(all["b"], 2.0);
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST_F(CounterStoreTest, KeyExpiresAfterTtl) {
    store.increment("k", 4.0, 20ms);
    EXPECT_DOUBLE_EQ(store.get("k"), 4.0);

    std::this_thread::sleep_for(60ms);

    EXPECT_DOUBLE_EQ(store.get("k"), 0.0);
    EXPECT_TRUE(store.entries().empty());
}

TEST_F(CounterStoreTest, ExpiredKeyRestartsFromZero) {
    store.increment("k", 4.0, 20ms);
    std::this_thread::sleep_for(60ms);

    EXPECT_DOUBLE_EQ(store.increment("k", 1.0, ttl), 1.0);
}

TEST_F(CounterStoreTest, IncrementRefreshesExpiry) {
    store.increment("k", 1.0, 20ms);
    store.increment("k", 1.0, std::chrono::seconds(10));

    std::this_thread::sleep_for(60ms);
    EXPECT_DOUBLE_EQ(store.get("k"), 2.0);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_F(CounterStoreTest, ConcurrentIncrementsAreAtomic) {
    const int threads = 8;
    const int per_thread = 1000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < per_thread; ++i) {
                store.increment("shared", 0.5, ttl);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_DOUBLE_EQ(store.get("shared"), threads * per_thread * 0.5);
}

TEST_F(CounterStoreTest, ConcurrentReserveReleaseReturnsToZero) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                store.increment("shared", 1.0, ttl);
                store.increment("shared", -1.0, ttl);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_DOUBLE_EQ(store.get("shared"), 0.0);
}
