#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

struct DecodedText {
    std::string text;           // UTF-8, BOM removed
    std::string encoding;       // Canonical name of the encoding that worked
};

/**
 * @brief Text decoder - turns raw file bytes into UTF-8
 *
 * Encodings are tried in the order given; the first one that accepts the
 * whole input wins. Conversion goes through ICU converters with a STOP
 * callback. Supported (case-insensitive, '_' treated as '-'):
 * - utf-8      strict validation (BOM stripped if present)
 * - utf-8-sig  strips a leading BOM, then strict UTF-8
 * - latin-1    every byte maps to U+0000-U+00FF (never fails)
 * - cp1252     Windows-1252; undefined bytes 0x81 0x8D 0x8F 0x90 0x9D fail
 */
class TextDecoder {
public:
    [[nodiscard]] static Result<DecodedText> decode(
        std::string_view bytes,
        const std::vector<std::string>& encodings);

    /**
     * @brief Decode with a single encoding
     * @return nullopt if the bytes are not valid in that encoding
     */
    [[nodiscard]] static std::optional<std::string> decode_as(
        std::string_view bytes,
        std::string_view encoding);

    // Canonical name ("utf-8", "latin-1", ...) or nullopt if unsupported
    [[nodiscard]] static std::optional<std::string> canonical_name(std::string_view encoding);

    [[nodiscard]] static bool is_supported(std::string_view encoding) {
        return canonical_name(encoding).has_value();
    }

    [[nodiscard]] static bool is_valid_utf8(std::string_view bytes);

    static constexpr std::string_view kBom = "\xEF\xBB\xBF";
};

} // namespace piiguard
