#include "content/prompt_guard.hpp"
#include "content/content_filters.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace llmshield {

namespace {

JsonValue to_json_array(const std::vector<std::string>& values) {
    JsonValue arr = JsonValue::array();
    for (const auto& v : values) arr.push_back(JsonValue(v));
    return arr;
}

void check_range(const std::optional<double>& value, const char* name,
                 double lo, double hi, std::vector<std::string>& problems) {
    if (!value) return;
    if (!(*value >= lo && *value <= hi)) {
        problems.push_back(std::format("{} must be between {} and {} (got {})", name, lo, hi, *value));
    }
}

} // anonymous namespace

PromptGuard::PromptGuard(Config config, std::shared_ptr<AuditTrail> audit)
    : config_(config),
      audit_(std::move(audit)),
      pii_detector_(PiiDetector::Config{config.mask_char, 2}) {
    if (config_.max_prompt_length == 0) {
        throw ConfigurationValidationError("prompt.max_prompt_length must be positive");
    }
}

// ============================================================================
// Prompt sanitization
// ============================================================================

SanitizationVerdict PromptGuard::sanitize_prompt(std::string_view prompt,
                                                 const Options& options) const {
    SanitizationVerdict verdict(prompt);
    std::string text(prompt);

    // 1. Length
    if (text.size() > config_.max_prompt_length) {
        JsonValue details = JsonValue::object();
        details.set("length", JsonValue(static_cast<unsigned long>(text.size())));
        details.set("max_length", JsonValue(static_cast<unsigned long>(config_.max_prompt_length)));
        verdict.add_warning("prompt_too_long",
            std::format("Prompt exceeds maximum length of {} characters", config_.max_prompt_length),
            std::move(details));

        if (!options.truncate) {
            verdict.blocked = true;
            return verdict;
        }
        text = filters::truncate_utf8(text, config_.max_prompt_length);
        verdict.sanitized = text;
        verdict.add_warning("prompt_truncated",
            std::format("Prompt truncated to {} characters", text.size()));
    }

    // 2. Injection
    if (config_.injection_detection) {
        const auto detection = injection_detector_.analyze(text);
        if (detection.detected()) {
            const auto classes = detection.pattern_classes();
            JsonValue details = JsonValue::object();
            details.set("pattern_classes", to_json_array(classes));
            details.set("match_count", JsonValue(static_cast<unsigned long>(detection.matches.size())));
            verdict.add_warning("injection_detected", "Potential prompt injection detected",
                                std::move(details));

            if (config_.block_on_injection) {
                verdict.blocked = true;
                audit_blocked("prompt_injection", "Blocked prompt injection attempt",
                              classes, prompt.size());
                return verdict;
            }
        }
    }

    // 3. PII
    if (config_.pii_detection) {
        const auto matches = pii_detector_.detect(text);
        if (!matches.empty()) {
            JsonValue counts = JsonValue::object();
            std::unordered_map<std::string, unsigned long> per_kind;
            for (const auto& m : matches) ++per_kind[pii_kind_to_string(m.kind)];
            for (const auto& [kind, count] : per_kind) counts.set(kind, JsonValue(count));

            verdict.add_warning("pii_detected", "Personally identifiable information detected",
                                std::move(counts));

            if (options.mask_pii) {
                text = pii_detector_.mask(text, matches);
                verdict.add_warning("pii_masked", "PII has been masked in the prompt");
            }
        }
    }

    // 4. Dangerous content
    std::string stripped = filters::strip_dangerous_content(text);
    if (stripped != text) {
        verdict.add_warning("dangerous_content_removed",
            "Script elements, event handlers or script URLs were removed");
    }
    verdict.sanitized = std::move(stripped);
    return verdict;
}

SanitizationVerdict PromptGuard::sanitize_system_prompt(std::string_view prompt) const {
    SanitizationVerdict verdict(prompt);

    if (prompt.size() > config_.max_prompt_length) {
        verdict.add_warning("prompt_too_long",
            std::format("System prompt exceeds maximum length of {} characters",
                        config_.max_prompt_length));
        verdict.blocked = true;
        return verdict;
    }

    if (const auto marker = injection_detector_.find_role_marker(prompt)) {
        JsonValue details = JsonValue::object();
        details.set("pattern_class", JsonValue(marker->pattern_class));
        verdict.add_warning("system_prompt_role_marker",
            "System prompt contains a role or instruction delimiter", std::move(details));
        verdict.blocked = true;
        audit_blocked("system_prompt_injection", "Blocked system prompt with role marker",
                      {marker->pattern_class}, prompt.size());
        return verdict;
    }

    std::string stripped = filters::strip_dangerous_content(prompt);
    if (stripped != verdict.original) {
        verdict.add_warning("dangerous_content_removed",
            "Script elements, event handlers or script URLs were removed");
    }
    verdict.sanitized = std::move(stripped);
    return verdict;
}

std::string PromptGuard::require_safe_prompt(std::string_view prompt, const Options& options) const {
    auto verdict = sanitize_prompt(prompt, options);
    if (verdict.blocked) {
        const auto codes = verdict.warning_codes();
        throw PromptBlocked(std::format("Prompt blocked: {}",
                                        codes.empty() ? std::string("policy") : codes.back()),
                            codes);
    }
    return std::move(verdict.sanitized);
}

void PromptGuard::audit_blocked(std::string_view activity, std::string_view description,
                                const std::vector<std::string>& pattern_classes,
                                size_t prompt_length) const {
    if (!audit_ || !config_.log_suspicious_prompts) return;
    JsonValue details = JsonValue::object();
    details.set("pattern_classes", to_json_array(pattern_classes));
    details.set("prompt_length", JsonValue(static_cast<unsigned long>(prompt_length)));
    audit_->log_suspicious_activity(activity, description, std::move(details));
}

// ============================================================================
// Field lengths
// ============================================================================

size_t PromptGuard::max_input_length(std::string_view field) {
    if (field == "model_name") return 100;
    if (field == "provider_name") return 50;
    if (field == "temperature") return 10;
    if (field == "max_tokens") return 10;
    if (field == "prompt_name") return 255;
    return 1000;
}

bool PromptGuard::validate_input_length(std::string_view field, std::string_view value) {
    return value.size() <= max_input_length(field);
}

// ============================================================================
// Model configuration
// ============================================================================

std::vector<std::string> PromptGuard::model_config_problems(const ModelConfig& config) const {
    std::vector<std::string> problems;
    check_range(config.temperature, "temperature", 0.0, 2.0, problems);
    check_range(config.top_p, "top_p", 0.0, 1.0, problems);
    check_range(config.frequency_penalty, "frequency_penalty", -2.0, 2.0, problems);
    check_range(config.presence_penalty, "presence_penalty", -2.0, 2.0, problems);
    if (config.max_tokens && (*config.max_tokens < 1 || *config.max_tokens > 200000)) {
        problems.push_back(std::format("max_tokens must be between 1 and 200000 (got {})",
                                       *config.max_tokens));
    }
    if (config.model && !validate_input_length("model_name", *config.model)) {
        problems.push_back("model exceeds 100 characters");
    }
    if (config.provider && !validate_input_length("provider_name", *config.provider)) {
        problems.push_back("provider exceeds 50 characters");
    }
    if (config.user && !validate_input_length("user", *config.user)) {
        problems.push_back("user exceeds 1000 characters");
    }
    return problems;
}

Result<PromptGuard::ModelConfig> PromptGuard::validate_model_config(const ModelConfig& config) const {
    ModelConfig clean = config;
    if (clean.model) clean.model = filters::strip_tags(*clean.model);
    if (clean.provider) clean.provider = filters::strip_tags(*clean.provider);
    if (clean.user) clean.user = filters::strip_tags(*clean.user);

    const auto problems = model_config_problems(clean);
    if (!problems.empty()) {
        std::string msg = "Invalid model configuration:";
        for (const auto& p : problems) msg += "\n  - " + p;
        return Result<ModelConfig>::error(ErrorCode::CONFIGURATION_VALIDATION, std::move(msg));
    }
    return Result<ModelConfig>::ok(std::move(clean));
}

PromptGuard::ModelConfig PromptGuard::sanitize_model_config(const ModelConfig& config) const {
    auto result = validate_model_config(config);
    if (result.is_error()) {
        ModelConfig stripped = config;
        if (stripped.model) stripped.model = filters::strip_tags(*stripped.model);
        if (stripped.provider) stripped.provider = filters::strip_tags(*stripped.provider);
        if (stripped.user) stripped.user = filters::strip_tags(*stripped.user);
        throw ConfigurationValidationError(result.error_message(), model_config_problems(stripped));
    }
    return std::move(result.value());
}

PromptGuard::ModelConfig PromptGuard::ModelConfig::from_json(const JsonValue& json) {
    if (!json.is_object()) {
        throw ConfigurationValidationError("Model configuration must be a JSON object");
    }
    ModelConfig config;
    std::vector<std::string> problems;

    auto number = [&](const char* key, std::optional<double>& out) {
        if (!json.contains(key)) return;
        if (!json[key].is_number()) {
            problems.push_back(std::format("{} must be a number", key));
            return;
        }
        out = json[key].get<double>();
    };
    auto text = [&](const char* key, std::optional<std::string>& out) {
        if (!json.contains(key)) return;
        if (!json[key].is_string()) {
            problems.push_back(std::format("{} must be a string", key));
            return;
        }
        out = json[key].get<std::string>();
    };

    number("temperature", config.temperature);
    number("top_p", config.top_p);
    number("frequency_penalty", config.frequency_penalty);
    number("presence_penalty", config.presence_penalty);
    if (json.contains("max_tokens")) {
        if (json["max_tokens"].is_number_integer()) {
            config.max_tokens = json["max_tokens"].get<int64_t>();
        } else {
            problems.push_back("max_tokens must be an integer");
        }
    }
    text("model", config.model);
    text("provider", config.provider);
    text("user", config.user);

    if (!problems.empty()) {
        std::string msg = "Invalid model configuration:";
        for (const auto& p : problems) msg += "\n  - " + p;
        throw ConfigurationValidationError(msg, std::move(problems));
    }
    return config;
}

JsonValue PromptGuard::ModelConfig::to_json() const {
    JsonValue out = JsonValue::object();
    if (temperature) out.set("temperature", JsonValue(*temperature));
    if (top_p) out.set("top_p", JsonValue(*top_p));
    if (frequency_penalty) out.set("frequency_penalty", JsonValue(*frequency_penalty));
    if (presence_penalty) out.set("presence_penalty", JsonValue(*presence_penalty));
    if (max_tokens) out.set("max_tokens", JsonValue(static_cast<long long>(*max_tokens)));
    if (model) out.set("model", JsonValue(*model));
    if (provider) out.set("provider", JsonValue(*provider));
    if (user) out.set("user", JsonValue(*user));
    return out;
}

} // namespace llmshield
