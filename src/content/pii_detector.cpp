#include "content/pii_detector.hpp"
#include "content/content_filters.hpp"

#include <algorithm>
#include <unordered_map>

namespace llmshield {

PiiDetector::PiiDetector(const Config& config) : config_(config) {
    constexpr auto flags = std::regex::ECMAScript | std::regex::optimize;
    patterns_.push_back({PiiKind::EMAIL, std::regex(
        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", flags)});
    patterns_.push_back({PiiKind::PHONE, std::regex(
        R"((\+\d{1,3}[\s-]?)?\(?\b\d{3}\)?[\s.-]?\d{3}[\s.-]?\d{4}\b)", flags)});
    patterns_.push_back({PiiKind::SSN, std::regex(
        R"(\b\d{3}-\d{2}-\d{4}\b)", flags)});
    patterns_.push_back({PiiKind::CREDIT_CARD, std::regex(
        R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)", flags)});
    patterns_.push_back({PiiKind::IP_ADDRESS, std::regex(
        R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", flags)});
}

std::vector<PiiDetector::Match> PiiDetector::detect(std::string_view text) const {
    std::vector<Match> found;
    for (const auto& slice : filters::bounded_slices(text)) {
        const char* first = slice.text.data();
        const char* last = first + slice.text.size();
        for (const auto& pattern : patterns_) {
            for (std::cregex_iterator it(first, last, pattern.regex, filters::slice_flags(slice)), end;
                 it != end; ++it) {
                found.push_back({pattern.kind, it->str(),
                                 slice.offset + static_cast<size_t>(it->position())});
            }
        }
    }
    std::stable_sort(found.begin(), found.end(), [](const Match& a, const Match& b) {
        if (a.offset != b.offset) return a.offset < b.offset;
        return a.value.size() > b.value.size();
    });

    // Overlapping slices report a value twice, and a slice cut can yield a
    // shorter match inside a full one. Keep the longest per span and kind.
    std::vector<Match> matches;
    std::unordered_map<PiiKind, size_t> covered_until;
    for (auto& m : found) {
        const size_t end = m.offset + m.value.size();
        auto& until = covered_until[m.kind];
        if (end <= until) continue;
        until = end;
        matches.push_back(std::move(m));
    }
    return matches;
}

std::string PiiDetector::mask(std::string_view text, const std::vector<Match>& matches) const {
    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const auto& m : matches) {
        if (m.offset < cursor || m.offset + m.value.size() > text.size()) continue;
        if (text.substr(m.offset, m.value.size()) != m.value) continue;
        out.append(text.substr(cursor, m.offset - cursor));
        out += mask_value(m.value);
        cursor = m.offset + m.value.size();
    }
    out.append(text.substr(cursor));
    return out;
}

std::string PiiDetector::mask_value(std::string_view value) const {
    const size_t keep = config_.reveal_chars;
    if (value.size() <= keep * 2) {
        return std::string(value.size(), config_.mask_char);
    }
    std::string masked(value.substr(0, keep));
    masked.append(value.size() - keep * 2, config_.mask_char);
    masked.append(value.substr(value.size() - keep));
    return masked;
}

} // namespace llmshield
