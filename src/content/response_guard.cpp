#include "content/response_guard.hpp"
#include "content/content_filters.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace llmshield {

namespace {

constexpr std::array<std::string_view, 25> kAllowedTags = {
    "p", "br", "strong", "em", "u", "s", "code", "pre",
    "h1", "h2", "h3", "h4", "h5", "h6",
    "ul", "ol", "li", "blockquote", "a",
    "table", "thead", "tbody", "tr", "th", "td"
};

// Dropped together with their content
constexpr std::array<std::string_view, 5> kDroppedTags = {
    "script", "style", "iframe", "object", "embed"
};

template <size_t N>
bool in_list(const std::array<std::string_view, N>& list, std::string_view name) {
    for (const auto& entry : list) {
        if (entry == name) return true;
    }
    return false;
}

bool attribute_allowed(std::string_view tag, std::string_view attr) {
    if (tag == "a") return attr == "href" || attr == "title" || attr == "rel";
    if (tag == "code" || tag == "pre") return attr == "class";
    return false;
}

std::string_view as_view(const xmlChar* s) {
    return s ? std::string_view(reinterpret_cast<const char*>(s)) : std::string_view{};
}

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* s) const { xmlFree(s); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlStringPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string attribute_value(xmlNode* node, xmlAttr* attr) {
    XmlStringPtr value(xmlNodeListGetString(node->doc, attr->children, 1));
    return std::string(as_view(value.get()));
}

xmlNode* find_element(xmlNode* node, std::string_view name) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE && as_view(cur->name) == name) return cur;
    }
    return nullptr;
}

// Markdown spans kept out of the tree filter travel through it as
// "<prefix><index><suffix>" and are put back only inside text nodes
constexpr std::string_view kVerbatimPrefix = "LLMSHIELDVERBATIM";
constexpr char kVerbatimSuffix = 'Z';

// Serializes the allow-listed subset of a parsed tree
class TreeWriter {
public:
    TreeWriter(const ResponseGuard& guard, ResponseGuard::FilterReport& report,
               const std::vector<std::string>* verbatim)
        : guard_(guard), config_(guard.config()), report_(report), verbatim_(verbatim) {}

    void children(xmlNode* first) {
        for (xmlNode* cur = first; cur; cur = cur->next) {
            node(cur);
        }
    }

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    void node(xmlNode* n) {
        switch (n->type) {
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                text(as_view(n->content));
                break;
            case XML_ELEMENT_NODE:
                element(n);
                break;
            default:
                // comments, processing instructions, DTD nodes
                break;
        }
    }

    void text(std::string_view content) {
        if (!verbatim_) {
            out_ += utils::html_escape(content);
            return;
        }
        size_t pos = 0;
        for (size_t at = content.find(kVerbatimPrefix); at != std::string_view::npos;
             at = content.find(kVerbatimPrefix, pos)) {
            const size_t digits = at + kVerbatimPrefix.size();
            size_t end = digits;
            while (end < content.size() && std::isdigit(static_cast<unsigned char>(content[end]))) ++end;

            size_t index = 0;
            const auto [ptr, ec] = std::from_chars(content.data() + digits, content.data() + end, index);
            if (ec != std::errc{} || end == content.size() || content[end] != kVerbatimSuffix ||
                index >= verbatim_->size()) {
                out_ += utils::html_escape(content.substr(pos, end - pos));
                pos = end;
                continue;
            }
            out_ += utils::html_escape(content.substr(pos, at - pos));
            out_ += (*verbatim_)[index];
            pos = end + 1;
        }
        out_ += utils::html_escape(content.substr(pos));
    }

    void element(xmlNode* n) {
        const std::string tag = utils::to_lower(as_view(n->name));

        if (in_list(kDroppedTags, tag)) {
            if (tag == "script") ++report_.scripts_removed;
            count_handlers(n);
            return;
        }
        count_handlers(n);

        if (!in_list(kAllowedTags, tag) || (tag == "a" && !config_.allow_links)) {
            ++report_.elements_unwrapped;
            children(n->children);
            return;
        }

        const bool isolate = config_.isolate_code_blocks && code_depth_ == 0 &&
                             (tag == "pre" || tag == "code");
        if (isolate) out_ += R"(<div class="llm-code-block">)";

        out_ += '<';
        out_ += tag;
        if (tag == "a") {
            link_attributes(n);
        } else {
            for (xmlAttr* attr = n->properties; attr; attr = attr->next) {
                const std::string name = utils::to_lower(as_view(attr->name));
                if (!attribute_allowed(tag, name)) continue;
                out_ += std::format(R"( {}="{}")", name, utils::html_escape(attribute_value(n, attr)));
            }
        }
        out_ += '>';

        if (tag == "br") {
            if (isolate) out_ += "</div>";
            return;
        }

        const bool code = tag == "pre" || tag == "code";
        if (code) ++code_depth_;
        children(n->children);
        if (code) --code_depth_;

        out_ += std::format("</{}>", tag);
        if (isolate) out_ += "</div>";
    }

    void link_attributes(xmlNode* n) {
        std::string href;
        bool has_href = false;
        std::string title;
        std::string rel;
        for (xmlAttr* attr = n->properties; attr; attr = attr->next) {
            const std::string name = utils::to_lower(as_view(attr->name));
            if (name == "href") {
                href = utils::trim(attribute_value(n, attr));
                has_href = true;
            } else if (name == "title") {
                title = attribute_value(n, attr);
            } else if (name == "rel") {
                rel = attribute_value(n, attr);
            }
        }

        bool valid = has_href && ResponseGuard::is_safe_url(href);
        if (has_href && !config_.validate_urls) {
            // without scheme validation, only script-capable schemes are rejected
            valid = !utils::contains_ci(href, "javascript:") &&
                    !utils::contains_ci(href, "vbscript:") &&
                    !utils::contains_ci(href, "data:");
        }

        if (valid) {
            out_ += std::format(R"( href="{}")", utils::html_escape(href));
        } else if (has_href) {
            ++report_.invalid_links;
        }
        if (!title.empty()) {
            out_ += std::format(R"( title="{}")", utils::html_escape(title));
        }
        if (valid && guard_.is_external_url(href)) {
            out_ += R"( rel="noopener noreferrer nofollow" target="_blank")";
        } else {
            if (!rel.empty()) out_ += std::format(R"( rel="{}")", utils::html_escape(rel));
            if (has_href && !valid) out_ += R"( data-invalid-url="true")";
        }
    }

    void count_handlers(xmlNode* n) {
        for (xmlAttr* attr = n->properties; attr; attr = attr->next) {
            if (utils::starts_with_ci(as_view(attr->name), "on")) ++report_.handlers_removed;
        }
    }

    const ResponseGuard& guard_;
    const ResponseGuard::Config& config_;
    ResponseGuard::FilterReport& report_;
    const std::vector<std::string>* verbatim_;
    std::string out_;
    int code_depth_ = 0;
};

// ============================================================================
// Markdown block scanning
// ============================================================================

bool is_blank(std::string_view line) {
    for (const char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Drops indentation, blockquote '>' and list markers from the front of a line
std::string_view strip_container_markers(std::string_view line) {
    size_t i = 0;
    while (i < line.size()) {
        const char c = line[i];
        if (c == ' ' || c == '\t' || c == '>') {
            ++i;
        } else if ((c == '-' || c == '*' || c == '+') && i + 1 < line.size() &&
                   (line[i + 1] == ' ' || line[i + 1] == '\t')) {
            i += 2;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j]))) ++j;
            if (j + 1 < line.size() && (line[j] == '.' || line[j] == ')') &&
                (line[j + 1] == ' ' || line[j + 1] == '\t')) {
                i = j + 2;
            } else {
                break;
            }
        } else {
            break;
        }
    }
    return line.substr(i);
}

bool starts_with_tag(std::string_view s) {
    if (s.size() < 2 || s[0] != '<') return false;
    const auto c = static_cast<unsigned char>(s[1]);
    return std::isalpha(c) || c == '/' || c == '!' || c == '?';
}

// A line opening raw HTML ends at a blank line, except the kinds that run
// to an explicit end marker (possibly across blank lines)
std::string_view raw_html_end_marker(std::string_view start) {
    constexpr std::array<std::pair<std::string_view, std::string_view>, 4> kRawText = {{
        {"<pre", "</pre>"}, {"<script", "</script>"}, {"<style", "</style>"}, {"<textarea", "</textarea>"},
    }};
    for (const auto& [open, close] : kRawText) {
        if (filters::find_ci(start, open) == 0) return close;
    }
    if (start.starts_with("<!--")) return "-->";
    if (start.starts_with("<![CDATA[")) return "]]>";
    if (start.starts_with("<?")) return "?>";
    if (start.starts_with("<!")) return ">";
    return {};
}

// ``` or ~~~ fence opening a code block (up to three spaces of indent)
std::optional<std::string> opening_fence(std::string_view line) {
    size_t i = 0;
    while (i < 3 && i < line.size() && line[i] == ' ') ++i;
    if (i >= line.size() || (line[i] != '`' && line[i] != '~')) return std::nullopt;
    const char c = line[i];
    size_t end = i;
    while (end < line.size() && line[end] == c) ++end;
    if (end - i < 3) return std::nullopt;
    if (c == '`' && line.find('`', end) != std::string_view::npos) return std::nullopt;
    return std::string(end - i, c);
}

bool closes_fence(std::string_view line, const std::string& fence) {
    size_t i = 0;
    while (i < 3 && i < line.size() && line[i] == ' ') ++i;
    size_t end = i;
    while (end < line.size() && line[end] == fence[0]) ++end;
    return end - i >= fence.size() && is_blank(line.substr(end));
}

// End of a tag starting at open, past the closing '>' (quotes respected)
size_t tag_end(std::string_view s, size_t open) {
    char quote = 0;
    for (size_t i = open + 1; i < s.size(); ++i) {
        if (quote) {
            if (s[i] == quote) quote = 0;
        } else if (s[i] == '"' || s[i] == '\'') {
            quote = s[i];
        } else if (s[i] == '>') {
            return i + 1;
        }
    }
    return s.size();
}

bool is_email_autolink(std::string_view inner) {
    const size_t at = inner.find('@');
    if (at == 0 || at == std::string_view::npos || at + 1 == inner.size()) return false;
    constexpr std::string_view kLocalExtra = ".!#$%&'*+/=?^_`{|}~-";
    for (const char c : inner.substr(0, at)) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && kLocalExtra.find(c) == std::string_view::npos) {
            return false;
        }
    }
    const std::string_view domain = inner.substr(at + 1);
    if (domain.front() == '.' || domain.front() == '-' || domain.back() == '.' || domain.back() == '-') {
        return false;
    }
    for (const char c : domain) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') return false;
    }
    return true;
}

bool is_uri_autolink(std::string_view inner) {
    const size_t colon = inner.find(':');
    if (colon == std::string_view::npos || colon < 2 || colon > 32) return false;
    if (!std::isalpha(static_cast<unsigned char>(inner[0]))) return false;
    for (size_t i = 1; i < colon; ++i) {
        const auto c = static_cast<unsigned char>(inner[i]);
        if (!std::isalnum(c) && c != '+' && c != '.' && c != '-') return false;
    }
    for (const char c : inner) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F || c == '<' || c == '>') return false;
    }
    return true;
}

// A paragraph with code spans and autolinks swapped for placeholders
struct ProtectedParagraph {
    std::string text;
    std::vector<std::string> verbatim;
    bool has_markup = false;    // something the tree filter has to see
};

ProtectedParagraph protect_spans(std::string_view p, bool allow_links) {
    ProtectedParagraph result;
    std::unordered_set<size_t> unclosed_runs;
    auto keep = [&](std::string_view raw) {
        result.text += std::format("{}{}{}", kVerbatimPrefix, result.verbatim.size(), kVerbatimSuffix);
        result.verbatim.emplace_back(raw);
    };

    size_t i = 0;
    while (i < p.size()) {
        const char c = p[i];
        if (c == '\\' && i + 1 < p.size()) {
            result.text.append(p.substr(i, 2));
            i += 2;
            continue;
        }
        if (c == '`') {
            size_t run_end = i;
            while (run_end < p.size() && p[run_end] == '`') ++run_end;
            const size_t n = run_end - i;

            size_t close = std::string_view::npos;
            if (!unclosed_runs.contains(n)) {
                for (size_t at = p.find('`', run_end); at != std::string_view::npos;) {
                    size_t e = at;
                    while (e < p.size() && p[e] == '`') ++e;
                    if (e - at == n) {
                        close = at;
                        break;
                    }
                    at = p.find('`', e);
                }
                if (close == std::string_view::npos) unclosed_runs.insert(n);
            }
            if (close == std::string_view::npos) {
                result.text.append(p.substr(i, n));
                i = run_end;
            } else {
                keep(p.substr(i, close + n - i));
                i = close + n;
            }
            continue;
        }
        if (c == '<') {
            if (const size_t gt = p.find('>', i + 1); gt != std::string_view::npos) {
                const std::string_view inner = p.substr(i + 1, gt - i - 1);
                const bool email = is_email_autolink(inner);
                if (email || is_uri_autolink(inner)) {
                    const std::string target = email ? "mailto:" + std::string(inner) : std::string(inner);
                    if (allow_links && ResponseGuard::is_safe_url(target)) {
                        keep(p.substr(i, gt - i + 1));
                    } else {
                        // shown as text, never as a link
                        result.text += utils::html_escape(p.substr(i, gt - i + 1));
                        result.has_markup = true;
                    }
                    i = gt + 1;
                    continue;
                }
            }
            if (starts_with_tag(p.substr(i))) {
                const size_t end = tag_end(p, i);
                result.text.append(p.substr(i, end - i));
                result.has_markup = true;
                i = end;
                continue;
            }
        }
        result.text.push_back(c);
        ++i;
    }
    return result;
}

} // anonymous namespace

ResponseGuard::ResponseGuard(Config config, std::shared_ptr<AuditTrail> audit)
    : config_(std::move(config)), audit_(std::move(audit)) {
    if (config_.max_response_length == 0) {
        throw ConfigurationValidationError("response.max_response_length must be positive");
    }
    config_.site_host = utils::to_lower(config_.site_host);
}

// ============================================================================
// Dispatch
// ============================================================================

std::string ResponseGuard::sanitize_response(std::string_view text, ResponseFormat format) const {
    std::string input;
    if (text.size() > config_.max_response_length) {
        input = filters::truncate_utf8(text, config_.max_response_length);
        input += kTruncationMarker;
    } else {
        input.assign(text);
    }

    FilterReport report;
    std::string out;
    switch (format) {
        case ResponseFormat::HTML:
            out = sanitize_html(input, &report);
            break;
        case ResponseFormat::MARKDOWN:
            out = sanitize_markdown(input, &report);
            break;
        case ResponseFormat::PLAIN:
            return sanitize_text(input);
    }

    if (audit_ && (report.scripts_removed > 0 || report.handlers_removed > 0)) {
        JsonValue details = JsonValue::object();
        details.set("format", JsonValue(std::string(response_format_to_string(format))));
        details.set("scripts_removed", JsonValue(static_cast<unsigned long>(report.scripts_removed)));
        details.set("handlers_removed", JsonValue(static_cast<unsigned long>(report.handlers_removed)));
        details.set("response_length", JsonValue(static_cast<unsigned long>(text.size())));
        audit_->log_suspicious_activity("response_script_content",
            "LLM response contained executable markup", std::move(details));
    }
    return out;
}

// ============================================================================
// HTML
// ============================================================================

std::string ResponseGuard::sanitize_html(std::string_view html, FilterReport* report) const {
    if (!config_.allow_html) {
        return sanitize_text(html);
    }

    FilterReport local;
    FilterReport& rep = report ? *report : local;

    std::string input = utils::fix_utf8(html);
    if (config_.strip_scripts) {
        filters::StripCounts counts;
        input = filters::strip_dangerous_content(input, &counts);
        rep.scripts_removed += counts.scripts;
        rep.handlers_removed += counts.handlers;
    }
    return filter_tree(input, rep);
}

std::string ResponseGuard::filter_tree(std::string_view html, FilterReport& report,
                                       const std::vector<std::string>* verbatim) const {
    const std::string document = std::format(
        R"(<!DOCTYPE html><html><head><meta charset="utf-8"></head><body>{}</body></html>)", html);

    XmlDocPtr doc(htmlReadMemory(document.data(), static_cast<int>(document.size()),
                                 nullptr, "UTF-8",
                                 HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc) {
        utils::log::warn("ResponseGuard: HTML parse failed, falling back to entity encoding");
        return sanitize_text(html);
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    xmlNode* body = root ? find_element(root->children, "body") : nullptr;
    if (!body) return std::string{};

    TreeWriter writer(*this, report, verbatim);
    writer.children(body->children);
    return writer.take();
}

// ============================================================================
// Markdown / text
// ============================================================================

std::string ResponseGuard::sanitize_markdown(std::string_view markdown, FilterReport* report) const {
    if (!config_.allow_markdown) {
        return sanitize_text(markdown);
    }

    FilterReport local;
    FilterReport& rep = report ? *report : local;

    std::string out = utils::fix_utf8(markdown);
    if (!config_.allow_html) {
        out = filters::strip_tags(out);
    } else {
        if (config_.strip_scripts) {
            filters::StripCounts counts;
            out = filters::strip_dangerous_content(out, &counts);
            rep.scripts_removed += counts.scripts;
            rep.handlers_removed += counts.handlers;
        }
        out = filter_markdown_html(out, rep);
    }

    if (config_.validate_urls || !config_.allow_links) {
        out = sanitize_markdown_links(out);
    }

    if (!config_.allow_html) {
        // stray angle brackets left after tag stripping
        std::string escaped;
        escaped.reserve(out.size());
        for (const char c : out) {
            if (c == '<') escaped += "&lt;";
            else if (c == '>') escaped += "&gt;";
            else escaped += c;
        }
        out = std::move(escaped);
    }
    return out;
}

// Inline HTML in markdown goes through the same tree filter as an HTML
// response, one paragraph at a time. Fenced code blocks pass unchanged
// unless they sit inside a raw HTML block, where a renderer would not
// treat them as code. Code spans and safe autolinks are kept verbatim
// except in paragraphs that open raw HTML.
std::string ResponseGuard::filter_markdown_html(std::string_view markdown, FilterReport& report) const {
    std::string out;
    out.reserve(markdown.size());

    std::string paragraph;
    bool paragraph_raw = false;     // paragraph contains a raw HTML block
    std::string fence;              // set while inside a fenced code block
    bool in_raw_html = false;
    std::string_view raw_end;       // explicit end marker of the raw HTML block

    auto flush = [&] {
        if (paragraph.empty()) return;
        out += filter_markdown_paragraph(paragraph, paragraph_raw, report);
        paragraph.clear();
        paragraph_raw = false;
    };

    size_t pos = 0;
    while (pos < markdown.size()) {
        const size_t eol = markdown.find('\n', pos);
        const size_t next = eol == std::string_view::npos ? markdown.size() : eol + 1;
        const std::string_view line = markdown.substr(pos, next - pos);
        pos = next;

        if (!fence.empty()) {
            out += line;
            if (closes_fence(line, fence)) fence.clear();
            continue;
        }

        if (!in_raw_html) {
            const std::string_view start = strip_container_markers(line);
            if (starts_with_tag(start)) {
                in_raw_html = true;
                raw_end = raw_html_end_marker(start);
            }
        }

        if (in_raw_html) {
            paragraph += line;
            paragraph_raw = true;
            if (!raw_end.empty() && filters::find_ci(line, raw_end) != std::string_view::npos) {
                raw_end = {};
            }
            if (raw_end.empty() && is_blank(line)) {
                in_raw_html = false;
                flush();
            }
            continue;
        }

        if (auto opened = opening_fence(line)) {
            flush();
            fence = std::move(*opened);
            out += line;
            continue;
        }

        paragraph += line;
        if (is_blank(line)) flush();
    }
    flush();
    return out;
}

std::string ResponseGuard::filter_markdown_paragraph(std::string_view paragraph, bool raw_html,
                                                     FilterReport& report) const {
    // trailing blank lines are kept out of the parser
    size_t body_end = paragraph.size();
    while (body_end > 0 && std::isspace(static_cast<unsigned char>(paragraph[body_end - 1]))) {
        --body_end;
    }
    const std::string_view body = paragraph.substr(0, body_end);
    const std::string_view tail = paragraph.substr(body_end);

    if (raw_html) {
        return filter_tree(body, report) + std::string(tail);
    }

    const auto spans = protect_spans(body, config_.allow_links);
    if (!spans.has_markup) {
        return std::string(paragraph);
    }
    return filter_tree(spans.text, report, &spans.verbatim) + std::string(tail);
}

std::string ResponseGuard::sanitize_markdown_links(std::string_view markdown) const {
    const bool links = config_.allow_links;

    // [text](url): text is everything up to the first ']', url everything
    // up to the first ')'
    std::string out;
    out.reserve(markdown.size());
    size_t pos = 0;
    size_t scan = 0;
    while (true) {
        const size_t open = markdown.find('[', scan);
        if (open == std::string_view::npos) break;
        const size_t close = markdown.find(']', open + 1);
        if (close == std::string_view::npos) break;
        if (close == open + 1 || close + 1 >= markdown.size() || markdown[close + 1] != '(') {
            scan = close == open + 1 ? open + 1 : close + 1;
            continue;
        }
        const size_t paren = markdown.find(')', close + 2);
        if (paren == std::string_view::npos) break;
        if (paren == close + 2) {
            scan = close + 1;
            continue;
        }

        const std::string url = utils::trim(std::string(markdown.substr(close + 2, paren - close - 2)));
        out.append(markdown.substr(pos, open - pos));
        if (links && is_safe_url(url)) {
            out.append(markdown.substr(open, paren + 1 - open));
        } else {
            out.append(markdown.substr(open + 1, close - open - 1));
        }
        pos = scan = paren + 1;
    }
    out.append(markdown.substr(pos));

    // [label]: url reference definitions, one per line; a rejected one
    // loses the whole line except its newline
    std::string result;
    result.reserve(out.size());
    size_t line_start = 0;
    while (line_start < out.size()) {
        const size_t eol = out.find('\n', line_start);
        const size_t line_end = eol == std::string::npos ? out.size() : eol;
        const std::string_view line = std::string_view(out).substr(line_start, line_end - line_start);

        bool drop = false;
        size_t i = 0;
        while (i < 3 && i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        if (i < line.size() && line[i] == '[') {
            const size_t label_end = line.find(']', i + 1);
            if (label_end != std::string_view::npos && label_end > i + 1 &&
                label_end + 1 < line.size() && line[label_end + 1] == ':') {
                size_t u = label_end + 2;
                while (u < line.size() && (line[u] == ' ' || line[u] == '\t')) ++u;
                size_t u_end = u;
                while (u_end < line.size() && !std::isspace(static_cast<unsigned char>(line[u_end]))) ++u_end;
                if (u_end > u) {
                    drop = !links || !is_safe_url(line.substr(u, u_end - u));
                }
            }
        }
        if (!drop) result.append(line);
        if (eol == std::string::npos) break;
        result.push_back('\n');
        line_start = eol + 1;
    }
    return result;
}

std::string ResponseGuard::sanitize_text(std::string_view text) {
    return utils::html_escape(text);
}

// ============================================================================
// Structured output / URLs
// ============================================================================

JsonValue ResponseGuard::sanitize_structured_output(const JsonValue& data) {
    if (data.is_string()) {
        std::string value = data.get<std::string>();
        std::erase(value, '\0');
        return JsonValue(utils::html_escape(utils::fix_utf8(value)));
    }
    if (data.is_array()) {
        JsonValue out = JsonValue::array();
        for (const auto& element : data.elements()) {
            out.push_back(sanitize_structured_output(element));
        }
        return out;
    }
    if (data.is_object()) {
        JsonValue out = JsonValue::object();
        for (const auto& [key, value] : data.items()) {
            out.set(key, sanitize_structured_output(value));
        }
        return out;
    }
    return data;
}

bool ResponseGuard::is_safe_url(std::string_view url) {
    return filters::is_safe_url(url);
}

bool ResponseGuard::is_external_url(std::string_view url) const {
    const auto host = filters::url_host(url);
    if (!host) return false;
    return config_.site_host.empty() || *host != config_.site_host;
}

} // namespace llmshield
