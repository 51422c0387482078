#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace llmshield {

/**
 * @brief Provider-specific API key format checks
 *
 * Known providers are matched against their key-prefix conventions.
 * Anything else must be at least kMinGenericLength characters. Nothing
 * longer than kMaxSecretLength is accepted or handed to a pattern.
 */
class CredentialValidator {
public:
    static constexpr size_t kMinGenericLength = 16;
    static constexpr size_t kMaxSecretLength = 4096;

    CredentialValidator();

    [[nodiscard]] bool is_valid(std::string_view provider, std::string_view secret) const;

    /// Adds or replaces the pattern for one provider.
    void register_pattern(const std::string& provider, const std::string& pattern);

    [[nodiscard]] bool has_pattern(std::string_view provider) const;

private:
    std::unordered_map<std::string, std::regex> patterns_;
};

} // namespace llmshield
