#pragma once

#include "audit/iaudit_store.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <memory>

namespace llmshield {

// IAuditStore over the `audit_events` table
class PgAuditStore : public IAuditStore {
public:
    explicit PgAuditStore(std::shared_ptr<PgConnection> conn);

    int64_t append(const AuditEvent& event) override;
    [[nodiscard]] std::vector<AuditEvent> query(
        const AuditFilter& filter, size_t limit, size_t offset) const override;
    size_t anonymize_before(std::chrono::system_clock::time_point threshold) override;
    size_t anonymize_actor(const std::string& actor_id) override;
    size_t purge_before(std::chrono::system_clock::time_point threshold) override;
    [[nodiscard]] std::string name() const override { return "postgresql"; }

private:
    std::shared_ptr<PgConnection> conn_;
};

} // namespace llmshield
