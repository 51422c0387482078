#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmshield {

/**
 * @brief Error kinds surfaced by the credential and content-safety layer
 */
enum class ErrorCode {
    NONE,
    INVALID_CREDENTIAL_FORMAT,
    NOT_FOUND,
    DECRYPTION_INTEGRITY,
    ACCESS_DENIED,
    QUOTA_EXCEEDED,
    PROMPT_BLOCKED,
    CONFIGURATION_VALIDATION,
    STORAGE_UNAVAILABLE,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                      return "none";
        case ErrorCode::INVALID_CREDENTIAL_FORMAT: return "invalid_credential_format";
        case ErrorCode::NOT_FOUND:                 return "not_found";
        case ErrorCode::DECRYPTION_INTEGRITY:      return "decryption_integrity";
        case ErrorCode::ACCESS_DENIED:             return "access_denied";
        case ErrorCode::QUOTA_EXCEEDED:            return "quota_exceeded";
        case ErrorCode::PROMPT_BLOCKED:            return "prompt_blocked";
        case ErrorCode::CONFIGURATION_VALIDATION:  return "configuration_validation";
        case ErrorCode::STORAGE_UNAVAILABLE:       return "storage_unavailable";
        case ErrorCode::INTERNAL_ERROR:            return "internal_error";
    }
    return "unknown";
}

// ============================================================================
// Exceptions (raised by require-style calls and unrecoverable failures)
// ============================================================================

class ShieldError : public std::runtime_error {
public:
    ShieldError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidCredentialFormat : public ShieldError {
public:
    explicit InvalidCredentialFormat(const std::string& message)
        : ShieldError(ErrorCode::INVALID_CREDENTIAL_FORMAT, message) {}
};

class NotFound : public ShieldError {
public:
    explicit NotFound(const std::string& message)
        : ShieldError(ErrorCode::NOT_FOUND, message) {}
};

class DecryptionIntegrityError : public ShieldError {
public:
    explicit DecryptionIntegrityError(const std::string& message)
        : ShieldError(ErrorCode::DECRYPTION_INTEGRITY, message) {}
};

class AccessDenied : public ShieldError {
public:
    AccessDenied(const std::string& message, std::string capability)
        : ShieldError(ErrorCode::ACCESS_DENIED, message),
          capability_(std::move(capability)) {}

    [[nodiscard]] const std::string& capability() const { return capability_; }

private:
    std::string capability_;
};

class QuotaExceeded : public ShieldError {
public:
    QuotaExceeded(const std::string& message, std::string dimension, int64_t usage, int64_t limit)
        : ShieldError(ErrorCode::QUOTA_EXCEEDED, message),
          dimension_(std::move(dimension)), usage_(usage), limit_(limit) {}

    [[nodiscard]] const std::string& dimension() const { return dimension_; }
    [[nodiscard]] int64_t usage() const { return usage_; }
    [[nodiscard]] int64_t limit() const { return limit_; }

private:
    std::string dimension_;
    int64_t usage_;
    int64_t limit_;
};

class PromptBlocked : public ShieldError {
public:
    PromptBlocked(const std::string& message, std::vector<std::string> warning_codes)
        : ShieldError(ErrorCode::PROMPT_BLOCKED, message),
          warning_codes_(std::move(warning_codes)) {}

    [[nodiscard]] const std::vector<std::string>& warning_codes() const { return warning_codes_; }

private:
    std::vector<std::string> warning_codes_;
};

class ConfigurationValidationError : public ShieldError {
public:
    explicit ConfigurationValidationError(const std::string& message,
                                          std::vector<std::string> problems = {})
        : ShieldError(ErrorCode::CONFIGURATION_VALIDATION, message),
          problems_(std::move(problems)) {}

    [[nodiscard]] const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;
};

class StorageUnavailable : public ShieldError {
public:
    explicit StorageUnavailable(const std::string& message)
        : ShieldError(ErrorCode::STORAGE_UNAVAILABLE, message) {}
};

// ============================================================================
// Result (returned by query-style calls)
// ============================================================================

/**
 * @brief Result type for operations that can fail without raising
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace llmshield
