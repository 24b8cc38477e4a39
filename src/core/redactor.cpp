#include "core/redactor.hpp"
#include "core/pii_patterns.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace piiguard {

namespace {

constexpr char kMaskChar = 'X';

bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset where each code point starts
std::vector<size_t> code_point_offsets(std::string_view value) {
    std::vector<size_t> offsets;
    offsets.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (!is_utf8_continuation(static_cast<unsigned char>(value[i]))) {
            offsets.push_back(i);
        }
    }
    return offsets;
}

// Span mask for phone matches: byte-wise, matches are ASCII
std::string keep_edges(std::string_view span) {
    if (span.size() <= 4) {
        return std::string(span.size(), kMaskChar);
    }
    std::string out;
    out.reserve(span.size());
    out.append(span.substr(0, 2));
    out.append(span.size() - 4, kMaskChar);
    out.append(span.substr(span.size() - 2));
    return out;
}

// "local@domain" -> "locXXX@domain"; short locals lose the prefix when
// keep_short_prefix is false
std::string mask_local_part(std::string_view match, bool keep_short_prefix) {
    const auto at = match.find('@');
    if (at == std::string_view::npos) return std::string(match);

    const auto local = match.substr(0, at);
    const auto domain = match.substr(at + 1);

    std::string out;
    out.reserve(match.size() + 3);
    if (local.size() > 3 || keep_short_prefix) {
        out.append(local.substr(0, 3));
    }
    out.append("XXX@");
    out.append(domain);
    return out;
}

} // anonymous namespace

std::string Redactor::mask(std::string_view value, Category category) {
    const std::string trimmed = utils::trim(value);
    if (trimmed.empty()) {
        return std::string(value);
    }

    switch (category) {
        case Category::PHONE:
            return mask_phone(trimmed);
        case Category::NATIONAL_ID:
            return mask_national_id(trimmed);
        case Category::PASSPORT:
            return std::string(kRedactedPassport);
        case Category::PAYMENT_HANDLE:
            return mask_handle(trimmed);
        case Category::EMAIL:
            return mask_email(trimmed);
        case Category::NAME:
            return mask_name(trimmed);
        case Category::ADDRESS:
            return std::string(kRedactedAddress);
        case Category::DEVICE_ID:
            return std::string(kRedactedDeviceId);
        case Category::IP_ADDRESS:
            return std::string(kRedactedIpAddress);
    }
    return partial_mask(trimmed);
}

std::string Redactor::partial_mask(std::string_view value) {
    const auto offsets = code_point_offsets(value);
    const size_t count = offsets.size();

    if (count <= 4) {
        return std::string(count, kMaskChar);
    }

    const size_t head_end = offsets[2];
    const size_t tail_start = offsets[count - 2];

    std::string result;
    result.reserve(head_end + (count - 4) + (value.size() - tail_start));
    result.append(value.substr(0, head_end));
    result.append(count - 4, kMaskChar);
    result.append(value.substr(tail_start));
    return result;
}

std::string Redactor::replace_spans(
    std::string_view text,
    const std::vector<Span>& spans,
    const SpanMasker& fn) {

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (const auto& s : spans) {
        if (s.offset < pos) continue;   // overlap with a previous span
        out.append(text.substr(pos, s.offset - pos));
        out.append(fn(text.substr(s.offset, s.length)));
        pos = s.offset + s.length;
    }
    out.append(text.substr(pos));
    return out;
}

// ============================================================================
// Per-category masks
// ============================================================================

std::string Redactor::mask_phone(std::string_view value) {
    const auto& p = PiiPatterns::instance();

    // Direct patterns, each over the output of the previous one. A masked
    // span carries X characters, so later patterns cannot re-match it.
    std::string working(value);
    bool matched = false;
    for (const auto* re : {&p.phone_international, &p.phone_prefixed,
                           &p.phone_mobile, &p.phone_digits}) {
        const auto spans = PiiPatterns::find_all(*re, working);
        if (spans.empty()) continue;
        matched = true;
        working = replace_spans(working, spans, keep_edges);
    }
    if (matched) return working;

    // Separated numbers: "(987) 654-3210"
    const auto runs = p.find_phone_digit_runs(value);
    if (!runs.empty()) {
        return replace_spans(value, runs, keep_edges);
    }

    return partial_mask(value);
}

std::string Redactor::mask_national_id(std::string_view value) {
    const auto spans = PiiPatterns::instance().find_national_ids(value);
    if (spans.empty()) {
        return partial_mask(value);
    }

    return replace_spans(value, spans, [](std::string_view span) {
        size_t digits = 0;
        for (const char c : span) {
            if (std::isdigit(static_cast<unsigned char>(c))) ++digits;
        }

        std::string out(span);
        size_t seen = 0;
        for (char& c : out) {
            if (!std::isdigit(static_cast<unsigned char>(c))) continue;
            if (seen + 4 < digits) c = kMaskChar;
            ++seen;
        }
        return out;
    });
}

std::string Redactor::mask_handle(std::string_view value) {
    const auto spans = PiiPatterns::find_all(PiiPatterns::instance().payment_handle, value);
    if (spans.empty()) {
        return partial_mask(value);
    }
    return replace_spans(value, spans, [](std::string_view match) {
        return mask_local_part(match, true);
    });
}

std::string Redactor::mask_email(std::string_view value) {
    const auto spans = PiiPatterns::find_all(PiiPatterns::instance().email, value);
    if (spans.empty()) {
        return partial_mask(value);
    }
    return replace_spans(value, spans, [](std::string_view match) {
        return mask_local_part(match, false);
    });
}

std::string Redactor::mask_name(std::string_view value) {
    const auto runs = PiiPatterns::instance().find_name_runs(value);
    if (runs.empty()) {
        return std::string(kRedactedName);
    }

    return replace_spans(value, runs, [](std::string_view run) {
        // Run is [A-Z][a-z]+ words separated by whitespace
        const auto last_word = run.find_last_of(" \t\n\r\f\v") + 1;
        std::string out;
        out.reserve(9);
        out.push_back(run.front());
        out.append("XXX ");
        out.push_back(run[last_word]);
        out.append("XXX");
        return out;
    });
}

} // namespace piiguard
