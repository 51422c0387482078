#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace llmshield {

/**
 * @brief Per-dimension limits; 0 means "not set here"
 */
struct QuotaLimits {
    int64_t requests_per_hour = 0;
    int64_t requests_per_day = 0;
    int64_t tokens_per_hour = 0;
    int64_t tokens_per_day = 0;
    double monthly_cost_limit = 0.0;

    [[nodiscard]] int64_t limit_for(QuotaDimension dimension) const {
        switch (dimension) {
            case QuotaDimension::REQUESTS_PER_HOUR: return requests_per_hour;
            case QuotaDimension::REQUESTS_PER_DAY:  return requests_per_day;
            case QuotaDimension::TOKENS_PER_HOUR:   return tokens_per_hour;
            case QuotaDimension::TOKENS_PER_DAY:    return tokens_per_day;
        }
        return 0;
    }
};

/**
 * @brief One row of the `quotas` table
 *
 * scope_type is "user", "group", "site" or "global" (scope_id "*").
 */
struct QuotaPolicy {
    std::string scope_type;
    std::string scope_id;
    QuotaLimits limits;
};

class IQuotaPolicyStore {
public:
    virtual ~IQuotaPolicyStore() = default;

    [[nodiscard]] virtual std::optional<QuotaPolicy> find(
        const std::string& scope_type, const std::string& scope_id) const = 0;

    virtual void upsert(const QuotaPolicy& policy) = 0;

    [[nodiscard]] virtual std::vector<QuotaPolicy> list() const = 0;
};

class MemoryQuotaPolicyStore : public IQuotaPolicyStore {
public:
    [[nodiscard]] std::optional<QuotaPolicy> find(
        const std::string& scope_type, const std::string& scope_id) const override {
        std::shared_lock lock(mutex_);
        const auto it = policies_.find({scope_type, scope_id});
        if (it == policies_.end()) return std::nullopt;
        return it->second;
    }

    void upsert(const QuotaPolicy& policy) override {
        std::unique_lock lock(mutex_);
        policies_.insert_or_assign({policy.scope_type, policy.scope_id}, policy);
    }

    [[nodiscard]] std::vector<QuotaPolicy> list() const override {
        std::shared_lock lock(mutex_);
        std::vector<QuotaPolicy> out;
        out.reserve(policies_.size());
        for (const auto& [key, policy] : policies_) out.push_back(policy);
        return out;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::string>, QuotaPolicy> policies_;
};

} // namespace llmshield
