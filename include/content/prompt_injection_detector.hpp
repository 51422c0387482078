#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Pattern-class scoring of outbound prompts
 *
 * Classes, checked in order:
 *   instruction_override  "ignore previous instructions", "forget everything"
 *   role_manipulation     "you are now a", "act as a", "pretend to be"
 *   role_delimiter        "system:", "new instructions:", [system], <|user|>,
 *                         "Instructions:" after a run of blank lines
 *   excessive_newlines    5 or more consecutive newlines
 *   delimiter_stacking    3 or more stacked ---, ===, *** runs
 *   base64_injection      50+ base64 chars that decode to override vocabulary
 *
 * Runs are counted with linear scans and every regex is searched over
 * bounded slices, so input length never drives regex recursion depth.
 */
class PromptInjectionDetector {
public:
    struct Match {
        std::string pattern_class;
        std::string pattern;        // source of the rule that fired
    };

    struct DetectionResult {
        std::vector<Match> matches;

        [[nodiscard]] bool detected() const { return !matches.empty(); }
        [[nodiscard]] std::vector<std::string> pattern_classes() const;
    };

    PromptInjectionDetector();

    [[nodiscard]] DetectionResult analyze(std::string_view text) const;

    /// First role/instruction delimiter in text, any role including system.
    /// Checks every role_delimiter rule of analyze() and more.
    [[nodiscard]] std::optional<Match> find_role_marker(std::string_view text) const;

private:
    struct Rule {
        std::string pattern_class;
        std::string source;
        std::regex regex;
    };

    void check_base64_payloads(std::string_view text, DetectionResult& result) const;
    static bool has_newline_run(std::string_view text);
    static bool has_stacked_delimiters(std::string_view text);

    std::vector<Rule> phrase_rules_;
    std::vector<Rule> role_marker_rules_;
    std::regex override_vocabulary_;
};

} // namespace llmshield
