#pragma once

#include "db/postgresql/pg_connection.hpp"
#include "usage/usage_ledger.hpp"

#include <memory>

namespace llmshield {

class PgUsageStore : public IUsageStore {
public:
    explicit PgUsageStore(std::shared_ptr<PgConnection> conn);

    int64_t append(const UsageRecord& record) override;
    [[nodiscard]] UsageSummary summarize(
        const std::optional<std::string>& actor_id,
        std::chrono::system_clock::time_point since) const override;
    [[nodiscard]] std::string name() const override { return "postgresql"; }

private:
    std::shared_ptr<PgConnection> conn_;
};

} // namespace llmshield
