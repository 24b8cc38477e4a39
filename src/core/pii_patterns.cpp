#include "core/pii_patterns.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <string>

namespace piiguard {

namespace {

constexpr std::array<std::string_view, 9> kGeographicStopwords = {
    "new", "york", "san", "los", "las", "north", "south", "east", "west"
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_phone_separator(char c) {
    return c == '-' || c == '(' || c == ')' || is_space(c);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Last whitespace in the back half of the window, else a hard cut
size_t window_end(std::string_view text, size_t pos) {
    const size_t limit = pos + PiiPatterns::kSearchWindow;
    if (limit >= text.size()) return text.size();
    for (size_t i = limit; i > pos + PiiPatterns::kSearchWindow / 2; --i) {
        if (is_space(text[i])) return i;
    }
    return limit;
}

// Matches within [pos, end), reported with offsets into the whole text.
// fn(Span) returns false to stop.
template<typename Fn>
void search_window(const std::regex& re, std::string_view text, size_t pos, size_t end, Fn&& fn) {
    using namespace std::regex_constants;

    auto flags = match_default;
    if (pos > 0) flags |= match_prev_avail;
    if (end < text.size()) {
        flags |= match_not_eol;
        if (is_word_char(text[end - 1]) && is_word_char(text[end])) flags |= match_not_eow;
    }

    const char* base = text.data();
    for (auto it = std::cregex_iterator(base + pos, base + end, re, flags);
         it != std::cregex_iterator(); ++it) {
        const size_t length = static_cast<size_t>(it->length(0));
        if (length == 0) continue;
        if (!fn(Span(pos + static_cast<size_t>(it->position(0)), length))) return;
    }
}

} // anonymous namespace

const PiiPatterns& PiiPatterns::instance() {
    static const PiiPatterns patterns;
    return patterns;
}

PiiPatterns::PiiPatterns()
    : phone_international(R"(\+91[-\s]?[789]\d{9}\b)"),
      phone_prefixed(R"(\b91[789]\d{9}\b)"),
      phone_mobile(R"(\b[789]\d{9}\b)"),
      phone_digits(R"(\b\d{10}\b)"),
      national_id(R"(\b[2-9]\d{3}\s?\d{4}\s?\d{4}\b)"),
      national_id_compact(R"(^[2-9]\d{11}$)"),
      passport(R"(\b[A-Za-z]\d{7}\b)"),
      payment_handle(R"(\b[a-zA-Z0-9.\-]{2,256}@[a-zA-Z]{2,64}\b)"),
      email(R"(\b[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}\b)"),
      name_run(R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)+\b)") {}

std::vector<Span> PiiPatterns::find_all(const std::regex& re, std::string_view text) {
    std::vector<Span> spans;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t end = window_end(text, pos);
        search_window(re, text, pos, end, [&](Span span) {
            const size_t span_end = span.offset + span.length;
            if (!spans.empty()) {
                auto& last = spans.back();
                const size_t last_end = last.offset + last.length;
                if (span_end <= last_end) return true;      // Already found in the overlap
                if (span.offset < last_end) {               // Continues across the window edge
                    last.length = span_end - last.offset;
                    return true;
                }
            }
            spans.push_back(span);
            return true;
        });

        if (end == text.size()) break;
        pos = end - kWindowOverlap;
    }
    return spans;
}

std::optional<Span> PiiPatterns::find_first(const std::regex& re, std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t end = window_end(text, pos);
        std::optional<Span> first;
        search_window(re, text, pos, end, [&](Span span) {
            first = span;
            return false;
        });
        if (first) return first;

        if (end == text.size()) break;
        pos = end - kWindowOverlap;
    }
    return std::nullopt;
}

std::optional<Span> PiiPatterns::find_phone(std::string_view text) const {
    for (const auto* re : {&phone_international, &phone_prefixed, &phone_mobile, &phone_digits}) {
        if (auto span = find_first(*re, text)) {
            return span;
        }
    }
    return std::nullopt;
}

std::vector<Span> PiiPatterns::find_phone_digit_runs(std::string_view text) const {
    std::string cleaned;
    std::vector<size_t> origin;   // cleaned index -> text index
    cleaned.reserve(text.size());
    origin.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_phone_separator(text[i])) {
            cleaned.push_back(text[i]);
            origin.push_back(i);
        }
    }

    std::vector<Span> spans;
    for (const auto& s : find_all(phone_digits, cleaned)) {
        const size_t first = origin[s.offset];
        const size_t last = origin[s.offset + s.length - 1];
        spans.emplace_back(first, last - first + 1);
    }
    return spans;
}

std::vector<Span> PiiPatterns::find_national_ids(std::string_view text) const {
    auto spans = find_all(national_id, text);
    if (!spans.empty()) return spans;

    std::string compact;
    compact.reserve(text.size());
    for (const char c : text) {
        if (!is_space(c)) compact.push_back(c);
    }
    if (compact.size() != 12 || !std::regex_match(compact, national_id_compact)) return spans;

    const auto first = text.find_first_not_of(" \t\n\r\f\v");
    const auto last = text.find_last_not_of(" \t\n\r\f\v");
    spans.emplace_back(first, last - first + 1);
    return spans;
}

bool PiiPatterns::is_geographic_stopword(std::string_view word) {
    const std::string lower = utils::to_lower(word);
    for (const auto stop : kGeographicStopwords) {
        if (lower == stop) return true;
    }
    return false;
}

std::vector<Span> PiiPatterns::find_name_runs(std::string_view text) const {
    std::vector<Span> runs;
    for (const auto& span : find_all(name_run, text)) {
        const auto run = text.substr(span.offset, span.length);

        // Reject runs where every word is a geographic stopword ("New York")
        bool all_stopwords = true;
        size_t pos = 0;
        while (pos < run.size()) {
            while (pos < run.size() && is_space(run[pos])) ++pos;
            size_t end = pos;
            while (end < run.size() && !is_space(run[end])) ++end;
            if (end > pos && !is_geographic_stopword(run.substr(pos, end - pos))) {
                all_stopwords = false;
                break;
            }
            pos = end;
        }

        if (!all_stopwords) {
            runs.push_back(span);
        }
    }
    return runs;
}

} // namespace piiguard
