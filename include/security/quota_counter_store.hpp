#pragma once

#include "core/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmshield {

/**
 * @brief Cache-like counter backend for quota windows
 *
 * increment() must be atomic against concurrent callers for the same key:
 * implementations use the backend's own atomic add, never read-then-write.
 * A counter vanishes once its TTL (set on first increment) elapses.
 */
class IQuotaCounterStore {
public:
    virtual ~IQuotaCounterStore() = default;

    /// Adds amount and returns the new value.
    virtual int64_t increment(const std::string& key, int64_t amount,
                              std::chrono::seconds ttl) = 0;

    /// Current value; 0 for missing or expired keys.
    [[nodiscard]] virtual int64_t get(const std::string& key) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief In-process counter store for single-node deployments and tests
 */
class MemoryQuotaCounterStore : public IQuotaCounterStore {
public:
    explicit MemoryQuotaCounterStore(std::shared_ptr<IClock> clock = nullptr);

    int64_t increment(const std::string& key, int64_t amount,
                      std::chrono::seconds ttl) override;

    [[nodiscard]] int64_t get(const std::string& key) const override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] size_t tracked_keys() const;

private:
    struct Counter {
        int64_t value = 0;
        std::chrono::system_clock::time_point expires_at;
    };

    void evict_expired();

    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Counter> counters_;
    std::atomic<uint64_t> eviction_counter_{0};
};

} // namespace llmshield
