#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield::filters {

// ============================================================================
// Bounded regex scanning
// ============================================================================

// std::regex backtracks recursively, one frame per repeated character, so a
// pattern with an unbounded repeat is never run over a whole prompt or
// response. Callers search overlapping slices of at most kSliceWindow bytes.

inline constexpr size_t kSliceWindow = 2048;
inline constexpr size_t kSliceOverlap = 256;

struct Slice {
    size_t offset = 0;          // of text.data() within the full input
    std::string_view text;
    bool last = false;
};

/// Overlapping windows covering text; a match shorter than `overlap` lies
/// wholly inside at least one window. Throws if overlap >= window.
[[nodiscard]] std::vector<Slice> bounded_slices(std::string_view text,
                                                size_t window = kSliceWindow,
                                                size_t overlap = kSliceOverlap);

/// Match flags that keep word boundaries honest at slice edges.
[[nodiscard]] std::regex_constants::match_flag_type slice_flags(const Slice& slice);

/// regex_search over bounded slices.
[[nodiscard]] bool search_bounded(std::string_view text, const std::regex& re);

// ============================================================================
// Content filters (linear scans)
// ============================================================================

struct StripCounts {
    size_t scripts = 0;         // <script> openers removed
    size_t handlers = 0;        // on*= attributes removed
};

/// First-pass removal of <script> elements, on* handlers inside tags and
/// javascript:/vbscript:/data:text/html URLs. Not a substitute for the
/// parse-tree allow-list in ResponseGuard.
[[nodiscard]] std::string strip_dangerous_content(std::string_view content,
                                                  StripCounts* counts = nullptr);

/// Position of an ASCII needle, ignoring case; needle must be lowercase.
[[nodiscard]] size_t find_ci(std::string_view haystack, std::string_view needle, size_t from = 0);

/// Removes anything shaped like a tag.
[[nodiscard]] std::string strip_tags(std::string_view content);

/// Cut at max_bytes without splitting a UTF-8 sequence.
[[nodiscard]] std::string truncate_utf8(std::string_view text, size_t max_bytes);

/// http, https (with a host) and mailto only.
[[nodiscard]] bool is_safe_url(std::string_view url);

/// Lowercased host of an absolute http(s) URL, without userinfo or port.
[[nodiscard]] std::optional<std::string> url_host(std::string_view url);

} // namespace llmshield::filters
