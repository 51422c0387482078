#pragma once

#include "db/postgresql/pg_connection.hpp"
#include "security/quota_counter_store.hpp"
#include "security/quota_policy_store.hpp"

#include <memory>

namespace llmshield {

// IQuotaPolicyStore over the `quotas` table
class PgQuotaPolicyStore : public IQuotaPolicyStore {
public:
    explicit PgQuotaPolicyStore(std::shared_ptr<PgConnection> conn);

    [[nodiscard]] std::optional<QuotaPolicy> find(
        const std::string& scope_type, const std::string& scope_id) const override;
    void upsert(const QuotaPolicy& policy) override;
    [[nodiscard]] std::vector<QuotaPolicy> list() const override;

private:
    std::shared_ptr<PgConnection> conn_;
};

/**
 * @brief Counters shared between processes via `quota_counters`
 *
 * increment() is a single INSERT ... ON CONFLICT DO UPDATE, so concurrent
 * callers never lose an update. An expired row restarts from the amount.
 */
class PgQuotaCounterStore : public IQuotaCounterStore {
public:
    explicit PgQuotaCounterStore(std::shared_ptr<PgConnection> conn);

    int64_t increment(const std::string& key, int64_t amount,
                      std::chrono::seconds ttl) override;
    [[nodiscard]] int64_t get(const std::string& key) const override;
    [[nodiscard]] std::string name() const override { return "postgresql"; }

    /// Deletes expired rows; returns how many.
    size_t purge_expired();

private:
    std::shared_ptr<PgConnection> conn_;
};

} // namespace llmshield
