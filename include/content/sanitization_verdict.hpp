#pragma once

#include "core/json.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

struct SanitizationWarning {
    std::string code;
    std::string message;
    JsonValue details = JsonValue::object();
};

/**
 * @brief Outcome of a guard pass over one piece of content
 *
 * Transient: handed straight back to the caller and never persisted.
 * When blocked, sanitized holds whatever was produced before the block and
 * must not be forwarded.
 */
struct SanitizationVerdict {
    std::string original;
    std::string sanitized;
    std::vector<SanitizationWarning> warnings;
    bool blocked = false;

    SanitizationVerdict() = default;
    explicit SanitizationVerdict(std::string_view input)
        : original(input), sanitized(input) {}

    void add_warning(std::string code, std::string message,
                     JsonValue details = JsonValue::object()) {
        warnings.push_back({std::move(code), std::move(message), std::move(details)});
    }

    [[nodiscard]] bool has_warning(std::string_view code) const {
        return std::any_of(warnings.begin(), warnings.end(),
                           [&](const SanitizationWarning& w) { return w.code == code; });
    }

    [[nodiscard]] std::vector<std::string> warning_codes() const {
        std::vector<std::string> codes;
        codes.reserve(warnings.size());
        for (const auto& w : warnings) codes.push_back(w.code);
        return codes;
    }

    [[nodiscard]] bool was_modified() const { return original != sanitized; }
};

} // namespace llmshield
