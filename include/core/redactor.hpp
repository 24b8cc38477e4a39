#pragma once

#include "core/types.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

inline constexpr std::string_view kRedactedPassport = "[REDACTED_PASSPORT]";
inline constexpr std::string_view kRedactedAddress = "[REDACTED_ADDRESS]";
inline constexpr std::string_view kRedactedDeviceId = "[REDACTED_DEVICE_ID]";
inline constexpr std::string_view kRedactedIpAddress = "[REDACTED_IP_ADDRESS]";
inline constexpr std::string_view kRedactedName = "XXXX";

/**
 * @brief Redactor - per-category masking of a single value
 *
 * Masks:
 * - PHONE:          Keep first 2 + last 2 chars of each match, X in between
 * - NATIONAL_ID:    Every digit but the last 4 becomes X, grouping kept
 * - PASSPORT:       "[REDACTED_PASSPORT]"
 * - PAYMENT_HANDLE: "joh" + "XXX@" + provider
 * - EMAIL:          "rah" + "XXX@" + domain ("XXX@" + domain for short locals)
 * - NAME:           "RXXX SXXX" per name run, "XXXX" without one
 * - ADDRESS / DEVICE_ID / IP_ADDRESS: fixed sentinel
 *
 * Total: never throws and never returns an empty string for non-empty input.
 * Surrounding whitespace is trimmed before masking; a blank value comes
 * back unchanged.
 */
class Redactor {
public:
    [[nodiscard]] static std::string mask(std::string_view value, Category category);

    /**
     * @brief Keep the first and last 2 code points, X for the rest
     *
     * Values of 4 code points or fewer become all X.
     */
    [[nodiscard]] static std::string partial_mask(std::string_view value);

private:
    using SpanMasker = std::function<std::string(std::string_view)>;

    // Rebuild text with each (sorted, non-overlapping) span passed through fn
    static std::string replace_spans(
        std::string_view text,
        const std::vector<Span>& spans,
        const SpanMasker& fn);

    static std::string mask_phone(std::string_view value);
    static std::string mask_national_id(std::string_view value);
    static std::string mask_handle(std::string_view value);
    static std::string mask_email(std::string_view value);
    static std::string mask_name(std::string_view value);
};

} // namespace piiguard
