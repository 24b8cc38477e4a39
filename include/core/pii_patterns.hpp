#pragma once

#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Precompiled PII patterns shared by the classifier and the redactor
 *
 * Built once on first use and never modified afterwards, so concurrent
 * searches from any number of threads are safe.
 *
 * All searches run over the caller's text in place; returned spans are
 * byte offsets into that text.
 *
 * std::regex recursion depth grows with the match length, so a search never
 * sees more than kSearchWindow bytes at once. Long text is scanned in
 * windows that end on whitespace where possible and overlap by
 * kWindowOverlap bytes. Word boundaries at a window edge are judged
 * against the neighbouring bytes, and a match that runs across an edge is
 * joined with its continuation in the next window.
 */
class PiiPatterns {
public:
    static constexpr size_t kSearchWindow = 1024;
    static constexpr size_t kWindowOverlap = 128;

    [[nodiscard]] static const PiiPatterns& instance();

    // Phone: +91 prefix, bare 91 prefix, mobile 10-digit, any 10-digit run
    std::regex phone_international;
    std::regex phone_prefixed;
    std::regex phone_mobile;
    std::regex phone_digits;

    // Aadhar: 12 digits, optionally grouped 4-4-4, first digit 2-9
    std::regex national_id;
    std::regex national_id_compact;

    std::regex passport;
    std::regex payment_handle;
    std::regex email;

    // Run of two or more capitalized Latin words
    std::regex name_run;

    /**
     * @brief All non-overlapping matches of a pattern, left to right
     */
    [[nodiscard]] static std::vector<Span> find_all(const std::regex& re, std::string_view text);

    [[nodiscard]] static std::optional<Span> find_first(const std::regex& re, std::string_view text);

    /**
     * @brief First phone match among the direct patterns (pattern order)
     */
    [[nodiscard]] std::optional<Span> find_phone(std::string_view text) const;

    /**
     * @brief 10-digit runs found after stripping '-', '(', ')' and whitespace
     *
     * Each span covers the original characters from the run's first digit to
     * its last digit, separators included.
     */
    [[nodiscard]] std::vector<Span> find_phone_digit_runs(std::string_view text) const;

    /**
     * @brief 12-digit national ID, grouped or contiguous
     *
     * Falls back to the whole text when it is exactly a valid 12-digit
     * number once all whitespace is removed.
     */
    [[nodiscard]] std::vector<Span> find_national_ids(std::string_view text) const;

    /**
     * @brief Capitalized word runs that are not made up only of geographic
     * stopwords (new, york, san, los, las, north, south, east, west)
     */
    [[nodiscard]] std::vector<Span> find_name_runs(std::string_view text) const;

    [[nodiscard]] static bool is_geographic_stopword(std::string_view word);

private:
    PiiPatterns();
};

} // namespace piiguard
