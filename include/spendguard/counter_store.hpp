#pragma once

#include "spendguard/types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace spendguard {

// Atomic, shared counter store keyed by scope. Every operation must be
// atomic on the server side; callers never read-modify-write.
class CounterStore {
public:
    virtual ~CounterStore() = default;

    // Adds delta and returns the new total. A result <= 0 deletes the key
    // and returns 0. A positive result refreshes the key's expiry.
    virtual Cents increment(const std::string& key, Cents delta, Duration ttl) = 0;

    // Current total, 0 for a missing or expired key
    virtual Cents get(const std::string& key) const = 0;

    // Every live key with its total
    virtual std::unordered_map<std::string, Cents> entries() const = 0;
};

// Mutex-guarded map for single-instance deployments
class InMemoryCounterStore : public CounterStore {
public:
    InMemoryCounterStore() = default;

    InMemoryCounterStore(const InMemoryCounterStore&) = delete;
    InMemoryCounterStore& operator=(const InMemoryCounterStore&) = delete;

    Cents increment(const std::string& key, Cents delta, Duration ttl) override;
    Cents get(const std::string& key) const override;
    std::unordered_map<std::string, Cents> entries() const override;

    std::size_t size() const;

private:
    struct Entry {
        Cents value{0.0};
        Timestamp expires_at{};
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> counters_;
};

} // namespace spendguard
