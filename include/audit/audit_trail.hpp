#pragma once

#include "audit/audit_event.hpp"
#include "audit/audit_sink.hpp"
#include "audit/iaudit_store.hpp"
#include "auth/iidentity_provider.hpp"
#include "core/clock.hpp"
#include "core/json.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Structured, privacy-preserving security event log
 *
 * One method per event category; each fixes the event type and severity.
 * Actor fields come from the identity collaborator at write time.
 *
 * Request and response logging take metadata structs only. There is no
 * parameter through which prompt or completion text could reach storage.
 *
 * Writes go to the durable IAuditStore. When the store throws, the event is
 * rerouted to the fallback sink (if configured) and, for error and critical
 * events, the operational log. Error and critical events are mirrored to the
 * operational log even when the store write succeeds.
 */
class AuditTrail {
public:
    struct Config {
        int retention_days = 90;
        int anonymize_after_days = 30;
    };

    struct RequestMetadata {
        std::string provider;
        std::string model;
        int64_t prompt_tokens = 0;
        int64_t prompt_length = 0;
    };

    struct ResponseMetadata {
        std::string provider;
        std::string model;
        int64_t completion_tokens = 0;
        int64_t total_tokens = 0;
        double duration_seconds = 0.0;
        int64_t response_length = 0;
    };

    struct Stats {
        uint64_t events_written = 0;
        uint64_t store_failures = 0;
        uint64_t fallback_writes = 0;
    };

    /**
     * @throws ConfigurationValidationError if retention_days < anonymize_after_days
     */
    AuditTrail(Config config,
               std::shared_ptr<IAuditStore> store,
               std::shared_ptr<IIdentityProvider> identity = nullptr,
               std::shared_ptr<IClock> clock = nullptr,
               std::shared_ptr<IAuditSink> fallback = nullptr);

    // ---- Credential events -------------------------------------------------

    void log_key_access(std::string_view provider, std::string_view scope);
    void log_key_access_attempt(std::string_view provider, std::string_view scope,
                                bool success, std::string_view reason,
                                Severity failure_severity = Severity::WARNING);
    void log_key_creation(std::string_view provider, std::string_view scope);
    void log_key_rotation(std::string_view provider, std::string_view scope);
    void log_key_deletion(std::string_view provider, std::string_view scope);

    // ---- Provider traffic (metadata only) ----------------------------------

    void log_llm_request(const RequestMetadata& meta);
    void log_llm_response(const ResponseMetadata& meta);
    void log_llm_error(std::string_view provider, std::string_view model,
                       std::string_view error_message, int status_code = 0);

    // ---- Governance --------------------------------------------------------

    void log_config_change(std::string_view config_key,
                           const JsonValue& old_value, const JsonValue& new_value);
    void log_access_denied(std::string_view capability, std::string_view context);
    void log_quota_exceeded(std::string_view subject, std::string_view dimension,
                            int64_t usage, int64_t limit);
    void log_suspicious_activity(std::string_view activity_type,
                                 std::string_view description,
                                 JsonValue details = JsonValue::object());

    // ---- Review & retention ------------------------------------------------

    [[nodiscard]] std::vector<AuditEvent> query(
        const AuditFilter& filter, size_t limit = 100, size_t offset = 0) const;

    /// Deletes events older than retention_days. Returns rows removed.
    size_t cleanup();

    /// Clears actor data on events older than anonymize_after_days. Returns rows changed.
    size_t anonymize();

    /// Right-to-erasure: anonymizes every event of one actor now, regardless of age.
    size_t erase_actor(const std::string& actor_id);

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] const Config& config() const { return config_; }

    /// Config-change value sanitizer (truncation + sensitive-key redaction).
    [[nodiscard]] static JsonValue sanitize_value(const JsonValue& value);

private:
    void record(AuditEventType type, Severity severity,
                std::string message, JsonValue details);
    void write_fallback(const AuditEvent& event);

    Config config_;
    std::shared_ptr<IAuditStore> store_;
    std::shared_ptr<IIdentityProvider> identity_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IAuditSink> fallback_;

    std::atomic<uint64_t> events_written_{0};
    std::atomic<uint64_t> store_failures_{0};
    std::atomic<uint64_t> fallback_writes_{0};
};

} // namespace llmshield
