#pragma once

#include "audit/iaudit_store.hpp"

#include <shared_mutex>
#include <vector>

namespace llmshield {

/**
 * @brief In-process audit store (tests, single-node deployments)
 */
class MemoryAuditStore : public IAuditStore {
public:
    MemoryAuditStore() = default;

    int64_t append(const AuditEvent& event) override;

    [[nodiscard]] std::vector<AuditEvent> query(
        const AuditFilter& filter, size_t limit, size_t offset) const override;

    size_t anonymize_before(std::chrono::system_clock::time_point threshold) override;
    size_t anonymize_actor(const std::string& actor_id) override;
    size_t purge_before(std::chrono::system_clock::time_point threshold) override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<AuditEvent> events_;    // insertion order == id order
    int64_t next_id_ = 1;
};

} // namespace llmshield
