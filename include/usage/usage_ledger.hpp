#pragma once

#include "auth/iidentity_provider.hpp"
#include "core/clock.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace llmshield {

// One row of the `usage` table
struct UsageRecord {
    int64_t id = 0;
    std::string actor_id;
    std::string scope_id;
    std::string provider;
    std::string model;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
    double estimated_cost = 0.0;
    double duration_seconds = 0.0;
    std::string status = "success";     // "success" | "error"
    std::string error_message;
    std::chrono::system_clock::time_point created_at;
};

struct UsageSummary {
    uint64_t requests = 0;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
    double estimated_cost = 0.0;
    uint64_t errors = 0;
};

class IUsageStore {
public:
    virtual ~IUsageStore() = default;

    /// @throws StorageUnavailable
    virtual int64_t append(const UsageRecord& record) = 0;

    [[nodiscard]] virtual UsageSummary summarize(
        const std::optional<std::string>& actor_id,
        std::chrono::system_clock::time_point since) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

class MemoryUsageStore : public IUsageStore {
public:
    int64_t append(const UsageRecord& record) override;

    [[nodiscard]] UsageSummary summarize(
        const std::optional<std::string>& actor_id,
        std::chrono::system_clock::time_point since) const override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<UsageRecord> records_;
    int64_t next_id_ = 1;
};

/**
 * @brief Per-request usage accounting (tokens, cost, outcome)
 *
 * Fills actor_id from the identity provider and created_at from the clock
 * when the caller leaves them empty.
 */
class UsageLedger {
public:
    UsageLedger(std::shared_ptr<IUsageStore> store,
                std::shared_ptr<IIdentityProvider> identity = nullptr,
                std::shared_ptr<IClock> clock = nullptr);

    int64_t record(UsageRecord record);

    [[nodiscard]] UsageSummary summarize(const std::optional<std::string>& actor_id,
                                         std::chrono::system_clock::time_point since) const;

    /// Cost since the first instant of the current UTC month.
    [[nodiscard]] double month_to_date_cost(const std::string& actor_id) const;

private:
    std::shared_ptr<IUsageStore> store_;
    std::shared_ptr<IIdentityProvider> identity_;
    std::shared_ptr<IClock> clock_;
};

} // namespace llmshield
