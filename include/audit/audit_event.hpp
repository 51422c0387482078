#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace llmshield {

/**
 * @brief One row of the audit trail
 *
 * Append-only. The only mutation after insert is anonymization, which
 * clears the four actor fields and sets `anonymized`.
 */
struct AuditEvent {
    int64_t id = 0;                         // assigned by the store
    AuditEventType event_type = AuditEventType::KEY_ACCESS;
    Severity severity = Severity::INFO;
    std::string message;
    std::string actor_id;
    std::string actor_name;
    std::string source_address;
    std::string user_agent;
    JsonValue details = JsonValue::object();
    std::chrono::system_clock::time_point created_at;
    bool anonymized = false;

    void clear_actor() {
        actor_id.clear();
        actor_name.clear();
        source_address.clear();
        user_agent.clear();
        anonymized = true;
    }
};

struct AuditFilter {
    std::optional<AuditEventType> event_type;
    std::optional<std::string> actor_id;
    std::optional<Severity> min_severity;   // inclusive
    std::optional<std::chrono::system_clock::time_point> from;
    std::optional<std::chrono::system_clock::time_point> to;

    [[nodiscard]] bool matches(const AuditEvent& event) const {
        if (event_type && event.event_type != *event_type) return false;
        if (actor_id && event.actor_id != *actor_id) return false;
        if (min_severity && event.severity < *min_severity) return false;
        if (from && event.created_at < *from) return false;
        if (to && event.created_at > *to) return false;
        return true;
    }
};

// Single-line JSON (journal lines, CLI output)
[[nodiscard]] inline std::string audit_event_to_json(const AuditEvent& event) {
    return std::format(
        R"({{"id":{},"event_type":"{}","severity":"{}","message":"{}",)"
        R"("actor_id":"{}","actor_name":"{}","source_address":"{}","user_agent":"{}",)"
        R"("details":{},"created_at":"{}","anonymized":{}}})",
        event.id,
        audit_event_type_to_string(event.event_type),
        severity_to_string(event.severity),
        utils::escape_json(event.message),
        utils::escape_json(event.actor_id),
        utils::escape_json(event.actor_name),
        utils::escape_json(event.source_address),
        utils::escape_json(event.user_agent),
        event.details.dump(),
        utils::format_timestamp(event.created_at),
        utils::booltostr(event.anonymized));
}

} // namespace llmshield
