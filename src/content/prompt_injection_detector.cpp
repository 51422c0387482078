#include "content/prompt_injection_detector.hpp"
#include "content/content_filters.hpp"
#include "core/base64.hpp"

#include <algorithm>
#include <cctype>

namespace llmshield {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

struct RuleSource {
    const char* pattern_class;
    const char* source;
};

constexpr RuleSource kPhraseRules[] = {
    {"instruction_override", R"(ignore\s+(previous|above|all|prior)\s+(instructions|rules|prompts))"},
    {"instruction_override", R"(forget\s+(everything|all|previous))"},
    {"instruction_override", R"(disregard\s+(previous|above|all))"},
    {"role_manipulation",    R"(you\s+are\s+now\s+(a|an)\b)"},
    {"role_manipulation",    R"(act\s+as\s+(a|an)\b)"},
    {"role_manipulation",    R"(pretend\s+(you|to)\s+(are|be)\b)"},
    {"role_manipulation",    R"(roleplay\s+as\b)"},
    {"role_delimiter",       R"(new\s+instructions?\s*:)"},
    {"role_delimiter",       R"(updated\s+instructions?\s*:)"},
    {"role_delimiter",       R"(\bsystem\s*:)"},
    {"role_delimiter",       R"(\bassistant\s*:)"},
    {"role_delimiter",       R"(---\s*end\s+of)"},
    {"role_delimiter",       R"(\[/?(system|user|assistant)\])"},
    {"role_delimiter",       R"(<\|?(system|user|assistant)\|>)"},
    {"role_delimiter",       R"(```\s*(system|instructions?)\b)"},
    {"role_delimiter",       R"(\n\n\n.*?(system|instructions?)\s*:)"},
};

// System prompts also refuse user and human turns and closing markers.
// Every role_delimiter rule above is added to this set as well.
constexpr RuleSource kExtraRoleMarkerRules[] = {
    {"role_delimiter", R"(<\|?/?(system|user|assistant)\|?>)"},
    {"role_delimiter", R"((^|\n)\s*(system|user|assistant|human)\s*:)"},
};

constexpr size_t kMinNewlineRun = 5;
constexpr size_t kMinStackedDelimiters = 3;
constexpr size_t kMinBase64Run = 50;

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '/';
}

bool is_heavy_delimiter(char c) { return c == '-' || c == '=' || c == '*'; }

} // anonymous namespace

std::vector<std::string> PromptInjectionDetector::DetectionResult::pattern_classes() const {
    std::vector<std::string> classes;
    for (const auto& m : matches) {
        if (std::find(classes.begin(), classes.end(), m.pattern_class) == classes.end()) {
            classes.push_back(m.pattern_class);
        }
    }
    return classes;
}

PromptInjectionDetector::PromptInjectionDetector()
    : override_vocabulary_(R"(system|instructions?|ignore|disregard)", kFlags) {
    // compiled once, shared by every analyze() call
    for (const auto& r : kPhraseRules) {
        phrase_rules_.push_back({r.pattern_class, r.source, std::regex(r.source, kFlags)});
        if (phrase_rules_.back().pattern_class == "role_delimiter") {
            role_marker_rules_.push_back(phrase_rules_.back());
        }
    }
    for (const auto& r : kExtraRoleMarkerRules) {
        role_marker_rules_.push_back({r.pattern_class, r.source, std::regex(r.source, kFlags)});
    }
}

PromptInjectionDetector::DetectionResult PromptInjectionDetector::analyze(std::string_view text) const {
    DetectionResult result;

    for (const auto& rule : phrase_rules_) {
        if (filters::search_bounded(text, rule.regex)) {
            result.matches.push_back({rule.pattern_class, rule.source});
        }
    }

    if (has_newline_run(text)) {
        result.matches.push_back({"excessive_newlines", "5 or more consecutive newlines"});
    }
    if (has_stacked_delimiters(text)) {
        result.matches.push_back({"delimiter_stacking", "3 or more stacked ---, === or *** runs"});
    }

    check_base64_payloads(text, result);
    return result;
}

std::optional<PromptInjectionDetector::Match> PromptInjectionDetector::find_role_marker(
    std::string_view text) const {
    for (const auto& rule : role_marker_rules_) {
        if (filters::search_bounded(text, rule.regex)) {
            return Match{rule.pattern_class, rule.source};
        }
    }
    return std::nullopt;
}

void PromptInjectionDetector::check_base64_payloads(std::string_view text,
                                                    DetectionResult& result) const {
    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_base64_char(text[pos])) {
            ++pos;
            continue;
        }
        size_t end = pos;
        while (end < text.size() && is_base64_char(text[end])) ++end;
        const size_t run = end - pos;
        for (int pad = 0; pad < 2 && end < text.size() && text[end] == '='; ++pad) ++end;

        if (run >= kMinBase64Run) {
            const auto decoded = base64::decode_strict(text.substr(pos, end - pos));
            if (decoded && filters::search_bounded(*decoded, override_vocabulary_)) {
                result.matches.push_back({"base64_injection", "base64 payload with override vocabulary"});
                return;
            }
        }
        pos = end;
    }
}

bool PromptInjectionDetector::has_newline_run(std::string_view text) {
    size_t run = 0;
    for (const char c : text) {
        run = c == '\n' ? run + 1 : 0;
        if (run >= kMinNewlineRun) return true;
    }
    return false;
}

bool PromptInjectionDetector::has_stacked_delimiters(std::string_view text) {
    // A run of one delimiter character counts as len / 3 stacked groups
    // ("---------" is three); a shorter run or any other character ends
    // the stack.
    size_t groups = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        size_t end = pos;
        while (end < text.size() && text[end] == c) ++end;
        const size_t len = end - pos;

        if (is_heavy_delimiter(c) && len >= 3) {
            groups += len / 3;
            if (groups >= kMinStackedDelimiters) return true;
        } else {
            groups = 0;
        }
        pos = end;
    }
    return false;
}

} // namespace llmshield
