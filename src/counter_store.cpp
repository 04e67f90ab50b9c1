#include "spendguard/counter_store.hpp"

namespace spendguard {

Cents InMemoryCounterStore::increment(const std::string& key, Cents delta, Duration ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();

    auto it = counters_.find(key);
    if (it != counters_.end() && it->second.expires_at <= now) {
        counters_.erase(it);
        it = counters_.end();
    }

    const Cents current = (it != counters_.end()) ? it->second.value : 0.0;
    const Cents total = current + delta;

    if (total <= 0.0) {
        if (it != counters_.end()) counters_.erase(it);
        return 0.0;
    }

    auto& entry = counters_[key];
    entry.value = total;
    entry.expires_at = now + ttl;
    return total;
}

Cents InMemoryCounterStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(key);
    if (it == counters_.end() || it->second.expires_at <= Clock::now()) return 0.0;
    return it->second.value;
}

std::unordered_map<std::string, Cents> InMemoryCounterStore::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    std::unordered_map<std::string, Cents> result;
    for (auto& [key, entry] : counters_) {
        if (entry.expires_at > now) result.emplace(key, entry.value);
    }
    return result;
}

std::size_t InMemoryCounterStore::size() const {
    return entries().size();
}

} // namespace spendguard
