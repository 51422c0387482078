#pragma once

#include "audit/audit_event.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace llmshield {

/**
 * @brief Durable storage for audit events (the `audit_events` table)
 *
 * append() throws StorageUnavailable when the backend cannot take the write.
 * anonymize_* and purge_before only touch rows they have not processed yet,
 * so repeated or overlapping calls are safe.
 */
class IAuditStore {
public:
    virtual ~IAuditStore() = default;

    /// Returns the id assigned to the stored event.
    virtual int64_t append(const AuditEvent& event) = 0;

    /// Newest first.
    [[nodiscard]] virtual std::vector<AuditEvent> query(
        const AuditFilter& filter, size_t limit, size_t offset) const = 0;

    /// Clears actor fields on non-anonymized events created before threshold.
    virtual size_t anonymize_before(std::chrono::system_clock::time_point threshold) = 0;

    /// Clears actor fields on every non-anonymized event of one actor.
    virtual size_t anonymize_actor(const std::string& actor_id) = 0;

    /// Deletes events created before threshold.
    virtual size_t purge_before(std::chrono::system_clock::time_point threshold) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace llmshield
