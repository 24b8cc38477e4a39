#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace piiguard {

/**
 * @brief JSON payload <-> Record
 *
 * The payload must be a flat JSON object. Key order is preserved both ways.
 * Numbers keep their integer/float kind and the text the source wrote;
 * booleans and null keep their kind.
 */
class PayloadCodec {
public:
    /**
     * @return DECODE_ERROR for malformed JSON, FORMAT_ERROR for a non-object
     *         payload or a nested array/object value
     */
    [[nodiscard]] static Result<Record> decode(std::string_view text);

    /**
     * @brief Compact JSON, invalid UTF-8 replaced with U+FFFD
     */
    [[nodiscard]] static std::string encode(const Record& record);
};

} // namespace piiguard
