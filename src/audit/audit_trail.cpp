#include "audit/audit_trail.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <stdexcept>

namespace llmshield {

namespace {

constexpr size_t kMaxConfigValueLength = 500;
constexpr std::string_view kTruncatedSuffix = "... [truncated]";
constexpr std::string_view kRedacted = "[REDACTED]";

constexpr std::array<std::string_view, 7> kSensitiveKeys = {
    "password", "api_key", "secret", "token", "encryption_key", "pepper", "root_secret"
};

bool is_sensitive_key(std::string_view key) {
    const std::string lower = utils::to_lower(key);
    for (const auto sensitive : kSensitiveKeys) {
        if (lower == sensitive) return true;
    }
    return false;
}

// "vault.pepper" -> "pepper"
std::string_view last_segment(std::string_view dotted) {
    const auto pos = dotted.rfind('.');
    return pos == std::string_view::npos ? dotted : dotted.substr(pos + 1);
}

JsonValue scope_details(std::string_view provider, std::string_view scope) {
    auto details = JsonValue::object();
    details.set("provider", provider);
    details.set("scope", scope);
    return details;
}

} // anonymous namespace

AuditTrail::AuditTrail(Config config,
                       std::shared_ptr<IAuditStore> store,
                       std::shared_ptr<IIdentityProvider> identity,
                       std::shared_ptr<IClock> clock,
                       std::shared_ptr<IAuditSink> fallback)
    : config_(config),
      store_(std::move(store)),
      identity_(std::move(identity)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      fallback_(std::move(fallback)) {
    if (!store_) {
        throw std::invalid_argument("AuditTrail requires an audit store");
    }
    if (config_.anonymize_after_days < 1) {
        throw ConfigurationValidationError(std::format(
            "audit.anonymize_after_days must be >= 1, got {}", config_.anonymize_after_days));
    }
    if (config_.retention_days < config_.anonymize_after_days) {
        throw ConfigurationValidationError(std::format(
            "audit.retention_days ({}) must be >= audit.anonymize_after_days ({})",
            config_.retention_days, config_.anonymize_after_days));
    }
}

// ============================================================================
// Credential events
// ============================================================================

void AuditTrail::log_key_access(std::string_view provider, std::string_view scope) {
    record(AuditEventType::KEY_ACCESS, Severity::INFO,
           std::format("API key accessed for {}/{}", provider, scope),
           scope_details(provider, scope));
}

void AuditTrail::log_key_access_attempt(std::string_view provider, std::string_view scope,
                                        bool success, std::string_view reason,
                                        Severity failure_severity) {
    auto details = scope_details(provider, scope);
    details.set("success", success);
    details.set("reason", reason);
    record(AuditEventType::KEY_ACCESS_ATTEMPT,
           success ? Severity::INFO : failure_severity,
           std::format("API key access attempt for {}/{}: {}",
                       provider, scope, success ? "success" : "failed"),
           std::move(details));
}

void AuditTrail::log_key_creation(std::string_view provider, std::string_view scope) {
    record(AuditEventType::KEY_CREATION, Severity::NOTICE,
           std::format("API key created for {}/{}", provider, scope),
           scope_details(provider, scope));
}

void AuditTrail::log_key_rotation(std::string_view provider, std::string_view scope) {
    record(AuditEventType::KEY_ROTATION, Severity::NOTICE,
           std::format("API key rotated for {}/{}", provider, scope),
           scope_details(provider, scope));
}

void AuditTrail::log_key_deletion(std::string_view provider, std::string_view scope) {
    record(AuditEventType::KEY_DELETION, Severity::NOTICE,
           std::format("API key deleted for {}/{}", provider, scope),
           scope_details(provider, scope));
}

// ============================================================================
// Provider traffic
// ============================================================================

void AuditTrail::log_llm_request(const RequestMetadata& meta) {
    auto details = JsonValue::object();
    details.set("provider", meta.provider);
    details.set("model", meta.model);
    details.set("prompt_tokens", meta.prompt_tokens);
    details.set("prompt_length", meta.prompt_length);
    record(AuditEventType::LLM_REQUEST, Severity::INFO,
           std::format("LLM request to {}/{}", meta.provider, meta.model),
           std::move(details));
}

void AuditTrail::log_llm_response(const ResponseMetadata& meta) {
    auto details = JsonValue::object();
    details.set("provider", meta.provider);
    details.set("model", meta.model);
    details.set("completion_tokens", meta.completion_tokens);
    details.set("total_tokens", meta.total_tokens);
    details.set("duration", meta.duration_seconds);
    details.set("response_length", meta.response_length);
    record(AuditEventType::LLM_RESPONSE, Severity::INFO,
           std::format("LLM response from {}/{}", meta.provider, meta.model),
           std::move(details));
}

void AuditTrail::log_llm_error(std::string_view provider, std::string_view model,
                               std::string_view error_message, int status_code) {
    auto details = JsonValue::object();
    details.set("provider", provider);
    details.set("model", model);
    details.set("error_message", error_message);
    details.set("status_code", status_code);
    record(AuditEventType::LLM_ERROR, Severity::ERROR,
           std::format("LLM error from {}/{}: {}", provider, model, error_message),
           std::move(details));
}

// ============================================================================
// Governance
// ============================================================================

void AuditTrail::log_config_change(std::string_view config_key,
                                   const JsonValue& old_value, const JsonValue& new_value) {
    auto details = JsonValue::object();
    details.set("config_key", config_key);
    if (is_sensitive_key(last_segment(config_key))) {
        details.set("old_value", kRedacted);
        details.set("new_value", kRedacted);
    } else {
        details.set("old_value", sanitize_value(old_value));
        details.set("new_value", sanitize_value(new_value));
    }
    record(AuditEventType::CONFIG_CHANGE, Severity::NOTICE,
           std::format("Configuration changed: {}", config_key),
           std::move(details));
}

void AuditTrail::log_access_denied(std::string_view capability, std::string_view context) {
    auto details = JsonValue::object();
    details.set("permission", capability);
    details.set("context", context);
    record(AuditEventType::ACCESS_DENIED, Severity::WARNING,
           std::format("Access denied: {}", capability),
           std::move(details));
}

void AuditTrail::log_quota_exceeded(std::string_view subject, std::string_view dimension,
                                    int64_t usage, int64_t limit) {
    auto details = JsonValue::object();
    details.set("subject", subject);
    details.set("quota_type", dimension);
    details.set("usage", usage);
    details.set("limit", limit);
    record(AuditEventType::QUOTA_EXCEEDED, Severity::WARNING,
           std::format("Quota exceeded: {}", dimension),
           std::move(details));
}

void AuditTrail::log_suspicious_activity(std::string_view activity_type,
                                         std::string_view description,
                                         JsonValue details) {
    if (!details.is_object()) {
        auto wrapped = JsonValue::object();
        wrapped.set("payload", std::move(details));
        details = std::move(wrapped);
    }
    details.set("activity_type", activity_type);
    record(AuditEventType::SUSPICIOUS_ACTIVITY, Severity::CRITICAL,
           std::format("Suspicious activity: {} - {}", activity_type, description),
           std::move(details));
}

// ============================================================================
// Review & retention
// ============================================================================

std::vector<AuditEvent> AuditTrail::query(
    const AuditFilter& filter, size_t limit, size_t offset) const {
    return store_->query(filter, limit, offset);
}

size_t AuditTrail::cleanup() {
    const auto threshold = clock_->now() - std::chrono::days(config_.retention_days);
    const size_t removed = store_->purge_before(threshold);
    if (removed > 0) {
        utils::log::info(std::format("Audit cleanup: removed {} events older than {} days",
                                     removed, config_.retention_days));
    }
    return removed;
}

size_t AuditTrail::anonymize() {
    const auto threshold = clock_->now() - std::chrono::days(config_.anonymize_after_days);
    const size_t changed = store_->anonymize_before(threshold);
    if (changed > 0) {
        utils::log::info(std::format("Audit anonymization: cleared actor data on {} events",
                                     changed));
    }
    return changed;
}

size_t AuditTrail::erase_actor(const std::string& actor_id) {
    const size_t changed = store_->anonymize_actor(actor_id);
    utils::log::info(std::format("Audit erasure for actor '{}': {} events anonymized",
                                 actor_id, changed));
    return changed;
}

AuditTrail::Stats AuditTrail::stats() const {
    Stats s;
    s.events_written = events_written_.load(std::memory_order_relaxed);
    s.store_failures = store_failures_.load(std::memory_order_relaxed);
    s.fallback_writes = fallback_writes_.load(std::memory_order_relaxed);
    return s;
}

JsonValue AuditTrail::sanitize_value(const JsonValue& value) {
    if (value.is_string()) {
        const auto s = value.get<std::string>();
        if (s.size() > kMaxConfigValueLength) {
            return JsonValue(s.substr(0, kMaxConfigValueLength) + std::string(kTruncatedSuffix));
        }
        return value;
    }

    if (value.is_object()) {
        auto out = JsonValue::object();
        for (const auto& [key, child] : value.items()) {
            out.set(key, is_sensitive_key(key) ? JsonValue(kRedacted) : sanitize_value(child));
        }
        return out;
    }

    if (value.is_array()) {
        auto out = JsonValue::array();
        for (const auto& child : value.elements()) {
            out.push_back(sanitize_value(child));
        }
        return out;
    }

    return value;
}

// ============================================================================
// Write path
// ============================================================================

void AuditTrail::record(AuditEventType type, Severity severity,
                        std::string message, JsonValue details) {
    AuditEvent event;
    event.event_type = type;
    event.severity = severity;
    event.message = std::move(message);
    event.details = std::move(details);
    event.created_at = clock_->now();

    if (identity_) {
        if (auto actor = identity_->current_actor()) {
            event.actor_id = std::move(actor->id);
            event.actor_name = std::move(actor->display_name);
            event.source_address = std::move(actor->source_address);
            event.user_agent = std::move(actor->user_agent);
        }
    }

    bool stored = false;
    try {
        event.id = store_->append(event);
        stored = true;
        events_written_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        store_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Audit store '{}' rejected {} event: {}",
                                      store_->name(), audit_event_type_to_string(type), e.what()));
    }

    if (!stored) {
        write_fallback(event);
    }

    if (severity >= Severity::ERROR) {
        utils::log::error(std::format("[audit:{}] {} {}",
            severity_to_string(severity), audit_event_type_to_string(type),
            audit_event_to_json(event)));
    }
}

void AuditTrail::write_fallback(const AuditEvent& event) {
    if (fallback_) {
        if (fallback_->write(audit_event_to_json(event))) {
            fallback_writes_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        utils::log::error(std::format("Audit fallback sink '{}' write failed", fallback_->name()));
    }
    if (event.severity < Severity::ERROR) {
        utils::log::warn(std::format("Audit event not persisted: {} ({})",
            audit_event_type_to_string(event.event_type), event.message));
    }
}

} // namespace llmshield
