#include "content/content_filters.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace llmshield::filters {

size_t find_ci(std::string_view haystack, std::string_view needle, size_t from) {
    if (needle.empty() || haystack.size() < needle.size()) return std::string_view::npos;
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        size_t k = 0;
        while (k < needle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + k])) == needle[k]) {
            ++k;
        }
        if (k == needle.size()) return i;
    }
    return std::string_view::npos;
}

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_word(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

size_t skip_space(std::string_view s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    return pos;
}

// Position of "<script" opening a tag at or after from
size_t find_script_open(std::string_view s, size_t from) {
    for (size_t at = find_ci(s, "<script", from); at != std::string_view::npos;
         at = find_ci(s, "<script", at + 1)) {
        const size_t after = at + 7;
        if (after == s.size() || !is_word(s[after])) return at;
    }
    return std::string_view::npos;
}

// <script ...>...</script> removed whole; an opening tag without a closing
// one loses only the tag (or the rest of the text when '>' never comes)
std::string strip_script_elements(std::string_view s, StripCounts& counts) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    bool closes_left = true;
    while (true) {
        const size_t open = find_script_open(s, pos);
        if (open == std::string_view::npos) break;
        out.append(s.substr(pos, open - pos));
        ++counts.scripts;

        const size_t tag_end = s.find('>', open);
        if (tag_end == std::string_view::npos) return out;

        size_t resume = tag_end + 1;
        bool closed = false;
        size_t close = closes_left ? find_ci(s, "</script", tag_end + 1) : std::string_view::npos;
        while (close != std::string_view::npos) {
            const size_t gt = skip_space(s, close + 8);
            if (gt < s.size() && s[gt] == '>') {
                resume = gt + 1;
                closed = true;
                break;
            }
            close = find_ci(s, "</script", close + 1);
        }
        // no closing tag past this point means none for later openers either
        if (!closed) closes_left = false;
        pos = resume;
    }
    out.append(s.substr(pos));
    return out;
}

// on*= attributes inside a tag, with the whitespace or '/' before them.
// Text outside tags is left alone so "only=true" in prose survives.
std::string strip_event_handlers(std::string_view s, StripCounts& counts) {
    std::string out;
    out.reserve(s.size());
    bool in_tag = false;
    char quote = 0;
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (!in_tag) {
            if (c == '<' && i + 1 < s.size() &&
                (std::isalpha(static_cast<unsigned char>(s[i + 1])) || s[i + 1] == '/')) {
                in_tag = true;
            }
            out.push_back(c);
            ++i;
            continue;
        }
        if (quote) {
            if (c == quote) quote = 0;
            out.push_back(c);
            ++i;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            out.push_back(c);
            ++i;
            continue;
        }
        if (c == '>') {
            in_tag = false;
            out.push_back(c);
            ++i;
            continue;
        }
        if (is_space(c) || c == '/') {
            size_t j = i;
            while (j < s.size() && (is_space(s[j]) || s[j] == '/')) ++j;
            size_t name_end = j;
            if (name_end + 2 < s.size() &&
                std::tolower(static_cast<unsigned char>(s[j])) == 'o' &&
                std::tolower(static_cast<unsigned char>(s[j + 1])) == 'n') {
                name_end = j + 2;
                while (name_end < s.size() && std::isalpha(static_cast<unsigned char>(s[name_end]))) {
                    ++name_end;
                }
            }
            size_t eq = skip_space(s, name_end);
            if (name_end > j + 2 && eq < s.size() && s[eq] == '=') {
                size_t value = skip_space(s, eq + 1);
                if (value < s.size() && (s[value] == '"' || s[value] == '\'')) {
                    const size_t close = s.find(s[value], value + 1);
                    value = close == std::string_view::npos ? s.size() : close + 1;
                } else {
                    while (value < s.size() && !is_space(s[value]) && s[value] != '>') ++value;
                }
                ++counts.handlers;
                i = value;
                continue;
            }
            out.append(s.substr(i, j - i));
            i = j;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

// "<scheme><spaces>:" removed wherever it appears
std::string remove_scheme(std::string_view s, std::string_view scheme) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    for (size_t at = find_ci(s, scheme, 0); at != std::string_view::npos;
         at = find_ci(s, scheme, at + 1)) {
        if (at < pos) continue;
        const size_t colon = skip_space(s, at + scheme.size());
        if (colon < s.size() && s[colon] == ':') {
            out.append(s.substr(pos, at - pos));
            pos = colon + 1;
        }
    }
    out.append(s.substr(pos));
    return out;
}

// data<spaces>:<spaces>text/html removed wherever it appears
std::string remove_html_data_urls(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    for (size_t at = find_ci(s, "data", 0); at != std::string_view::npos;
         at = find_ci(s, "data", at + 1)) {
        if (at < pos) continue;
        const size_t colon = skip_space(s, at + 4);
        if (colon >= s.size() || s[colon] != ':') continue;
        const size_t type = skip_space(s, colon + 1);
        if (find_ci(s.substr(type, 9), "text/html", 0) == 0) {
            out.append(s.substr(pos, at - pos));
            pos = type + 9;
        }
    }
    out.append(s.substr(pos));
    return out;
}

std::optional<std::string> url_scheme(std::string_view url) {
    const size_t colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) return std::nullopt;
    for (size_t i = 1; i < colon; ++i) {
        const auto c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::nullopt;
    }
    return utils::to_lower(url.substr(0, colon));
}

} // anonymous namespace

std::vector<Slice> bounded_slices(std::string_view text, size_t window, size_t overlap) {
    if (window == 0 || overlap >= window) {
        throw std::invalid_argument("bounded_slices: overlap must be smaller than window");
    }
    std::vector<Slice> slices;
    size_t start = 0;
    while (true) {
        const size_t end = std::min(start + window, text.size());
        slices.push_back({start, text.substr(start, end - start), end == text.size()});
        if (end == text.size()) break;
        start = end - overlap;
    }
    return slices;
}

std::regex_constants::match_flag_type slice_flags(const Slice& slice) {
    auto flags = std::regex_constants::match_default;
    // \b and ^ look at the character before the slice, and a match may not
    // end on a word boundary that only exists because the slice was cut
    if (slice.offset > 0) flags |= std::regex_constants::match_prev_avail;
    if (!slice.last) flags |= std::regex_constants::match_not_eow | std::regex_constants::match_not_eol;
    return flags;
}

bool search_bounded(std::string_view text, const std::regex& re) {
    for (const auto& slice : bounded_slices(text)) {
        const char* first = slice.text.data();
        if (std::regex_search(first, first + slice.text.size(), re, slice_flags(slice))) {
            return true;
        }
    }
    return false;
}

std::string strip_dangerous_content(std::string_view content, StripCounts* counts) {
    StripCounts local;
    StripCounts& tally = counts ? *counts : local;

    // Repeat until stable: removing "javascript:" from
    // "javajavascript:script:" leaves a fresh one behind. Every pass only
    // removes, so an unchanged size means nothing changed.
    std::string out(content);
    while (true) {
        std::string next = strip_script_elements(out, tally);
        next = strip_event_handlers(next, tally);
        next = remove_scheme(next, "javascript");
        next = remove_scheme(next, "vbscript");
        next = remove_html_data_urls(next);
        if (next.size() == out.size()) break;
        out = std::move(next);
    }
    return out;
}

std::string strip_tags(std::string_view content) {
    std::string out;
    out.reserve(content.size());
    size_t pos = 0;
    while (pos < content.size()) {
        const size_t open = content.find('<', pos);
        if (open == std::string_view::npos) break;
        const size_t close = content.find('>', open);
        if (close == std::string_view::npos) break;
        out.append(content.substr(pos, open - pos));
        pos = close + 1;
    }
    out.append(content.substr(pos));
    return out;
}

std::string truncate_utf8(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

bool is_safe_url(std::string_view url) {
    const std::string trimmed = utils::trim(std::string(url));
    if (trimmed.empty()) return false;

    for (const char c : trimmed) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) return false;
    }
    if (utils::contains_ci(trimmed, "javascript:") || utils::contains_ci(trimmed, "vbscript:") ||
        utils::contains_ci(trimmed, "data:")) {
        return false;
    }

    const auto scheme = url_scheme(trimmed);
    if (!scheme) return false;
    if (*scheme == "mailto") return trimmed.size() > 7;
    if (*scheme == "http" || *scheme == "https") return url_host(trimmed).has_value();
    return false;
}

std::optional<std::string> url_host(std::string_view url) {
    const auto scheme = url_scheme(url);
    if (!scheme || (*scheme != "http" && *scheme != "https")) return std::nullopt;

    const size_t authority_start = scheme->size() + 1;
    if (url.substr(authority_start, 2) != "//") return std::nullopt;

    std::string_view rest = url.substr(authority_start + 2);
    rest = rest.substr(0, rest.find_first_of("/?#"));
    if (const size_t at = rest.rfind('@'); at != std::string_view::npos) {
        rest = rest.substr(at + 1);
    }
    if (!rest.empty() && rest.front() == '[') {
        const size_t close = rest.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        rest = rest.substr(0, close + 1);
    } else {
        rest = rest.substr(0, rest.find(':'));
    }
    if (rest.empty()) return std::nullopt;
    return utils::to_lower(rest);
}

} // namespace llmshield::filters
