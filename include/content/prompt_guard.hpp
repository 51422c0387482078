#pragma once

#include "audit/audit_trail.hpp"
#include "content/pii_detector.hpp"
#include "content/prompt_injection_detector.hpp"
#include "content/sanitization_verdict.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief Outbound prompt sanitization
 *
 * sanitize_prompt() runs, in order: length enforcement, injection
 * detection, PII detection/masking, dangerous-content stripping. Each step
 * records its findings as warnings on the verdict. A blocked verdict
 * returns immediately and is the caller's signal not to send the prompt.
 *
 * Blocked injection attempts are audited as suspicious_activity (critical)
 * with the matched pattern classes and the prompt length; prompt text is
 * never written to the audit trail.
 */
class PromptGuard {
public:
    struct Config {
        bool injection_detection = true;
        bool block_on_injection = true;
        bool log_suspicious_prompts = true;
        size_t max_prompt_length = 50000;
        bool pii_detection = false;
        char mask_char = '*';
    };

    struct Options {
        bool truncate = false;      // truncate over-long prompts instead of blocking
        bool mask_pii = false;
    };

    // Sampling parameters forwarded to a provider; unset fields are not sent.
    struct ModelConfig {
        std::optional<double> temperature;
        std::optional<double> top_p;
        std::optional<double> frequency_penalty;
        std::optional<double> presence_penalty;
        std::optional<int64_t> max_tokens;
        std::optional<std::string> model;
        std::optional<std::string> provider;
        std::optional<std::string> user;

        [[nodiscard]] static ModelConfig from_json(const JsonValue& json);
        [[nodiscard]] JsonValue to_json() const;
    };

    explicit PromptGuard(Config config, std::shared_ptr<AuditTrail> audit = nullptr);

    [[nodiscard]] SanitizationVerdict sanitize_prompt(std::string_view prompt,
                                                      const Options& options = {}) const;

    /// Any role or instruction delimiter blocks; no tolerance threshold.
    [[nodiscard]] SanitizationVerdict sanitize_system_prompt(std::string_view prompt) const;

    /// Sanitized prompt text, or PromptBlocked carrying the warning codes.
    std::string require_safe_prompt(std::string_view prompt, const Options& options = {}) const;

    /// Range-checks numeric parameters; never clamps.
    [[nodiscard]] Result<ModelConfig> validate_model_config(const ModelConfig& config) const;

    /// @throws ConfigurationValidationError listing every violated bound
    [[nodiscard]] ModelConfig sanitize_model_config(const ModelConfig& config) const;

    [[nodiscard]] static bool validate_input_length(std::string_view field, std::string_view value);
    [[nodiscard]] static size_t max_input_length(std::string_view field);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] std::vector<std::string> model_config_problems(const ModelConfig& config) const;
    void audit_blocked(std::string_view activity, std::string_view description,
                       const std::vector<std::string>& pattern_classes,
                       size_t prompt_length) const;

    Config config_;
    std::shared_ptr<AuditTrail> audit_;
    PromptInjectionDetector injection_detector_;
    PiiDetector pii_detector_;
};

} // namespace llmshield
