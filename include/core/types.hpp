#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace llmshield {

// ============================================================================
// Audit Enums
// ============================================================================

enum class AuditEventType {
    KEY_ACCESS,
    KEY_ACCESS_ATTEMPT,
    KEY_CREATION,
    KEY_ROTATION,
    KEY_DELETION,
    LLM_REQUEST,
    LLM_RESPONSE,
    LLM_ERROR,
    CONFIG_CHANGE,
    ACCESS_DENIED,
    QUOTA_EXCEEDED,
    SUSPICIOUS_ACTIVITY
};

// Ordered: comparisons on the underlying value are meaningful
enum class Severity : uint8_t {
    INFO = 0,
    NOTICE = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// ============================================================================
// Access Enums
// ============================================================================

enum class Capability {
    USE_LLM,
    CONFIGURE_PROMPTS,
    MANAGE_KEYS,
    VIEW_REPORTS,
    ADMIN_ALL
};

enum class QuotaDimension {
    REQUESTS_PER_HOUR,
    REQUESTS_PER_DAY,
    TOKENS_PER_HOUR,
    TOKENS_PER_DAY
};

// ============================================================================
// Content Enums
// ============================================================================

enum class ResponseFormat {
    HTML,
    MARKDOWN,
    PLAIN
};

enum class PiiKind {
    EMAIL,
    PHONE,
    SSN,
    CREDIT_CARD,
    IP_ADDRESS
};

// ============================================================================
// Utility Functions
// ============================================================================

inline constexpr std::array<AuditEventType, 12> kAllAuditEventTypes = {
    AuditEventType::KEY_ACCESS, AuditEventType::KEY_ACCESS_ATTEMPT,
    AuditEventType::KEY_CREATION, AuditEventType::KEY_ROTATION,
    AuditEventType::KEY_DELETION, AuditEventType::LLM_REQUEST,
    AuditEventType::LLM_RESPONSE, AuditEventType::LLM_ERROR,
    AuditEventType::CONFIG_CHANGE, AuditEventType::ACCESS_DENIED,
    AuditEventType::QUOTA_EXCEEDED, AuditEventType::SUSPICIOUS_ACTIVITY
};

inline constexpr const char* audit_event_type_to_string(AuditEventType type) {
    switch (type) {
        case AuditEventType::KEY_ACCESS:          return "key_access";
        case AuditEventType::KEY_ACCESS_ATTEMPT:  return "key_access_attempt";
        case AuditEventType::KEY_CREATION:        return "key_creation";
        case AuditEventType::KEY_ROTATION:        return "key_rotation";
        case AuditEventType::KEY_DELETION:        return "key_deletion";
        case AuditEventType::LLM_REQUEST:         return "llm_request";
        case AuditEventType::LLM_RESPONSE:        return "llm_response";
        case AuditEventType::LLM_ERROR:           return "llm_error";
        case AuditEventType::CONFIG_CHANGE:       return "config_change";
        case AuditEventType::ACCESS_DENIED:       return "access_denied";
        case AuditEventType::QUOTA_EXCEEDED:      return "quota_exceeded";
        case AuditEventType::SUSPICIOUS_ACTIVITY: return "suspicious_activity";
    }
    return "unknown";
}

inline std::optional<AuditEventType> parse_audit_event_type(std::string_view name) {
    for (const auto type : kAllAuditEventTypes) {
        if (name == audit_event_type_to_string(type)) return type;
    }
    return std::nullopt;
}

inline constexpr const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::NOTICE:   return "notice";
        case Severity::WARNING:  return "warning";
        case Severity::ERROR:    return "error";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

inline std::optional<Severity> parse_severity(std::string_view name) {
    if (name == "info") return Severity::INFO;
    if (name == "notice") return Severity::NOTICE;
    if (name == "warning") return Severity::WARNING;
    if (name == "error") return Severity::ERROR;
    if (name == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

inline constexpr const char* capability_to_string(Capability capability) {
    switch (capability) {
        case Capability::USE_LLM:           return "use_llm";
        case Capability::CONFIGURE_PROMPTS: return "configure_prompts";
        case Capability::MANAGE_KEYS:       return "manage_keys";
        case Capability::VIEW_REPORTS:      return "view_reports";
        case Capability::ADMIN_ALL:         return "admin_all";
    }
    return "unknown";
}

inline std::optional<Capability> parse_capability(std::string_view name) {
    if (name == "use_llm") return Capability::USE_LLM;
    if (name == "configure_prompts") return Capability::CONFIGURE_PROMPTS;
    if (name == "manage_keys") return Capability::MANAGE_KEYS;
    if (name == "view_reports") return Capability::VIEW_REPORTS;
    if (name == "admin_all") return Capability::ADMIN_ALL;
    return std::nullopt;
}

inline constexpr const char* quota_dimension_to_string(QuotaDimension dimension) {
    switch (dimension) {
        case QuotaDimension::REQUESTS_PER_HOUR: return "requests_per_hour";
        case QuotaDimension::REQUESTS_PER_DAY:  return "requests_per_day";
        case QuotaDimension::TOKENS_PER_HOUR:   return "tokens_per_hour";
        case QuotaDimension::TOKENS_PER_DAY:    return "tokens_per_day";
    }
    return "unknown";
}

inline std::optional<QuotaDimension> parse_quota_dimension(std::string_view name) {
    if (name == "requests_per_hour") return QuotaDimension::REQUESTS_PER_HOUR;
    if (name == "requests_per_day") return QuotaDimension::REQUESTS_PER_DAY;
    if (name == "tokens_per_hour") return QuotaDimension::TOKENS_PER_HOUR;
    if (name == "tokens_per_day") return QuotaDimension::TOKENS_PER_DAY;
    return std::nullopt;
}

inline constexpr std::chrono::seconds quota_window(QuotaDimension dimension) {
    switch (dimension) {
        case QuotaDimension::REQUESTS_PER_DAY:
        case QuotaDimension::TOKENS_PER_DAY:
            return std::chrono::seconds(86400);
        case QuotaDimension::REQUESTS_PER_HOUR:
        case QuotaDimension::TOKENS_PER_HOUR:
            return std::chrono::seconds(3600);
    }
    return std::chrono::seconds(3600);
}

inline constexpr const char* response_format_to_string(ResponseFormat format) {
    switch (format) {
        case ResponseFormat::HTML:     return "html";
        case ResponseFormat::MARKDOWN: return "markdown";
        case ResponseFormat::PLAIN:    return "plain";
    }
    return "plain";
}

// Unknown formats map to PLAIN (entity-encoded)
inline ResponseFormat parse_response_format(std::string_view name) {
    if (name == "html") return ResponseFormat::HTML;
    if (name == "markdown" || name == "md") return ResponseFormat::MARKDOWN;
    return ResponseFormat::PLAIN;
}

inline constexpr const char* pii_kind_to_string(PiiKind kind) {
    switch (kind) {
        case PiiKind::EMAIL:       return "email";
        case PiiKind::PHONE:       return "phone";
        case PiiKind::SSN:         return "ssn";
        case PiiKind::CREDIT_CARD: return "credit_card";
        case PiiKind::IP_ADDRESS:  return "ip_address";
    }
    return "unknown";
}

} // namespace llmshield
