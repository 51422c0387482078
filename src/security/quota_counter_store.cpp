#include "security/quota_counter_store.hpp"

namespace llmshield {

MemoryQuotaCounterStore::MemoryQuotaCounterStore(std::shared_ptr<IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

int64_t MemoryQuotaCounterStore::increment(const std::string& key, int64_t amount,
                                           std::chrono::seconds ttl) {
    // Periodic eviction: every 1000 increments, drop expired windows
    if (eviction_counter_.fetch_add(1, std::memory_order_relaxed) % 1000 == 999) {
        evict_expired();
    }

    const auto now = clock_->now();
    std::lock_guard lock(mutex_);
    auto& counter = counters_[key];
    if (counter.value == 0 || counter.expires_at <= now) {
        counter.value = 0;
        counter.expires_at = now + ttl;
    }
    counter.value += amount;
    return counter.value;
}

int64_t MemoryQuotaCounterStore::get(const std::string& key) const {
    const auto now = clock_->now();
    std::lock_guard lock(mutex_);
    const auto it = counters_.find(key);
    if (it == counters_.end() || it->second.expires_at <= now) return 0;
    return it->second.value;
}

size_t MemoryQuotaCounterStore::tracked_keys() const {
    std::lock_guard lock(mutex_);
    return counters_.size();
}

void MemoryQuotaCounterStore::evict_expired() {
    const auto now = clock_->now();
    std::lock_guard lock(mutex_);
    std::erase_if(counters_, [&](const auto& entry) {
        return entry.second.expires_at <= now;
    });
}

} // namespace llmshield
