#include "security/credential_validator.hpp"
#include "core/utils.hpp"

namespace llmshield {

CredentialValidator::CredentialValidator() {
    register_pattern("openai",      R"(^sk-[A-Za-z0-9]{32,}$)");
    register_pattern("openai_org",  R"(^org-[A-Za-z0-9]{24,}$)");
    register_pattern("anthropic",   R"(^sk-ant-[A-Za-z0-9\-_]{32,}$)");
    register_pattern("azure",       R"(^[A-Za-z0-9]{32}$)");
    register_pattern("huggingface", R"(^hf_[A-Za-z0-9]{34}$)");
}

void CredentialValidator::register_pattern(const std::string& provider, const std::string& pattern) {
    patterns_.insert_or_assign(utils::to_lower(provider),
                               std::regex(pattern, std::regex::ECMAScript | std::regex::optimize));
}

bool CredentialValidator::has_pattern(std::string_view provider) const {
    return patterns_.contains(utils::to_lower(provider));
}

bool CredentialValidator::is_valid(std::string_view provider, std::string_view secret) const {
    if (secret.size() > kMaxSecretLength) return false;

    const auto it = patterns_.find(utils::to_lower(provider));
    if (it == patterns_.end()) {
        return secret.size() >= kMinGenericLength;
    }
    return std::regex_match(secret.begin(), secret.end(), it->second);
}

} // namespace llmshield
