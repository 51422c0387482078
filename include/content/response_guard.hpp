#pragma once

#include "audit/audit_trail.hpp"
#include "core/json.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Inbound LLM output sanitization
 *
 * HTML goes through a linear first pass (scripts, handlers, script URLs)
 * and is then re-serialized from a libxml2 parse tree against a fixed
 * tag/attribute allow-list, so malformed markup cannot smuggle elements
 * past the filter. Inline HTML in markdown goes through the same tree
 * filter, and markdown link targets are validated; plain text and
 * unknown formats are entity-encoded.
 *
 * Output over max_response_length is cut and ends with "\n[Output truncated]".
 */
class ResponseGuard {
public:
    struct Config {
        bool allow_html = true;
        bool allow_markdown = true;
        bool allow_links = true;
        bool validate_urls = true;
        bool strip_scripts = true;
        bool isolate_code_blocks = true;
        size_t max_response_length = 100000;
        std::string site_host;      // links to other hosts are external
    };

    // Per-call counts of what the HTML pass removed
    struct FilterReport {
        size_t scripts_removed = 0;
        size_t handlers_removed = 0;
        size_t invalid_links = 0;
        size_t elements_unwrapped = 0;
    };

    static constexpr std::string_view kTruncationMarker = "\n[Output truncated]";

    explicit ResponseGuard(Config config, std::shared_ptr<AuditTrail> audit = nullptr);

    [[nodiscard]] std::string sanitize_response(std::string_view text, ResponseFormat format) const;

    [[nodiscard]] std::string sanitize_html(std::string_view html,
                                            FilterReport* report = nullptr) const;
    [[nodiscard]] std::string sanitize_markdown(std::string_view markdown,
                                                FilterReport* report = nullptr) const;
    [[nodiscard]] static std::string sanitize_text(std::string_view text);

    /// Every string value, recursively: NUL removed, UTF-8 repaired, HTML-escaped.
    [[nodiscard]] static JsonValue sanitize_structured_output(const JsonValue& data);

    [[nodiscard]] static bool is_safe_url(std::string_view url);
    [[nodiscard]] bool is_external_url(std::string_view url) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] std::string filter_tree(std::string_view html, FilterReport& report,
                                          const std::vector<std::string>* verbatim = nullptr) const;
    [[nodiscard]] std::string filter_markdown_html(std::string_view markdown, FilterReport& report) const;
    [[nodiscard]] std::string filter_markdown_paragraph(std::string_view paragraph, bool raw_html,
                                                        FilterReport& report) const;
    [[nodiscard]] std::string sanitize_markdown_links(std::string_view markdown) const;

    Config config_;
    std::shared_ptr<AuditTrail> audit_;
};

} // namespace llmshield
