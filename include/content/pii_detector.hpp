#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Regex PII detection and masking for prompts
 *
 * Detects email addresses, phone numbers, SSN-like IDs, card-like digit
 * groups and IPv4 addresses. Masking keeps the first and last
 * `reveal_chars` characters of each match; matches of 2 * reveal_chars
 * characters or fewer are masked completely.
 */
class PiiDetector {
public:
    struct Config {
        char mask_char = '*';
        size_t reveal_chars = 2;
    };

    struct Match {
        PiiKind kind;
        std::string value;
        size_t offset = 0;
    };

    PiiDetector() : PiiDetector(Config{}) {}
    explicit PiiDetector(const Config& config);

    /// All matches, ordered by offset. Overlapping matches are all reported.
    [[nodiscard]] std::vector<Match> detect(std::string_view text) const;

    /// Masks matches left to right; a match overlapping an earlier one is skipped.
    [[nodiscard]] std::string mask(std::string_view text, const std::vector<Match>& matches) const;

    [[nodiscard]] std::string mask_value(std::string_view value) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Pattern {
        PiiKind kind;
        std::regex regex;
    };

    Config config_;
    std::vector<Pattern> patterns_;
};

} // namespace llmshield
