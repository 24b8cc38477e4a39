#include "io/text_decoder.hpp"
#include "core/utils.hpp"

#include <unicode/ucnv.h>
#include <unicode/unistr.h>

#include <array>
#include <climits>
#include <format>
#include <memory>

namespace piiguard {

namespace {

// Bytes Windows-1252 leaves undefined
constexpr std::array<unsigned char, 5> kCp1252Undefined = {0x81, 0x8D, 0x8F, 0x90, 0x9D};

struct ConverterCloser {
    void operator()(UConverter* conv) const { ucnv_close(conv); }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;

// ICU converter name for each canonical encoding
const char* icu_converter_name(std::string_view canonical) {
    if (canonical == "latin-1") return "ISO-8859-1";
    if (canonical == "cp1252") return "windows-1252";
    return "UTF-8";
}

/**
 * @brief Convert bytes to UTF-8 through an ICU converter
 *
 * The STOP callback makes any illegal or unmapped byte sequence fail the
 * whole conversion instead of being substituted.
 */
std::optional<std::string> convert_to_utf8(std::string_view bytes, const char* converter_name) {
    if (bytes.size() >= static_cast<size_t>(INT32_MAX)) {
        utils::log::warn(std::format("Input of {} bytes is too large to decode", bytes.size()));
        return std::nullopt;
    }

    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr conv(ucnv_open(converter_name, &status));
    if (U_FAILURE(status)) {
        utils::log::error(std::format("Cannot open converter {}: {}",
                                      converter_name, u_errorName(status)));
        return std::nullopt;
    }
    ucnv_setToUCallBack(conv.get(), UCNV_TO_U_CALLBACK_STOP,
                        nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status)) return std::nullopt;

    // Every supported encoding yields at most one UTF-16 unit per byte
    const auto capacity = static_cast<int32_t>(bytes.size()) + 1;
    icu::UnicodeString text;
    UChar* buffer = text.getBuffer(capacity);
    if (buffer == nullptr) return std::nullopt;

    const int32_t length = ucnv_toUChars(conv.get(), buffer, capacity,
                                         bytes.data(), static_cast<int32_t>(bytes.size()),
                                         &status);
    text.releaseBuffer(U_SUCCESS(status) ? length : 0);
    if (U_FAILURE(status)) return std::nullopt;

    std::string out;
    out.reserve(bytes.size());
    text.toUTF8String(out);
    return out;
}

std::string_view strip_bom(std::string_view bytes) {
    if (bytes.starts_with(TextDecoder::kBom)) {
        bytes.remove_prefix(TextDecoder::kBom.size());
    }
    return bytes;
}

bool has_cp1252_undefined(std::string_view bytes) {
    for (const char c : bytes) {
        const auto b = static_cast<unsigned char>(c);
        for (const auto undefined : kCp1252Undefined) {
            if (b == undefined) return true;
        }
    }
    return false;
}

} // anonymous namespace

bool TextDecoder::is_valid_utf8(std::string_view bytes) {
    return convert_to_utf8(bytes, "UTF-8").has_value();
}

std::optional<std::string> TextDecoder::canonical_name(std::string_view encoding) {
    std::string name = utils::to_lower(utils::trim(encoding));
    for (char& c : name) {
        if (c == '_') c = '-';
    }

    if (name == "utf-8" || name == "utf8") return "utf-8";
    if (name == "utf-8-sig" || name == "utf8-sig") return "utf-8-sig";
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1") return "latin-1";
    if (name == "cp1252" || name == "windows-1252") return "cp1252";
    return std::nullopt;
}

std::optional<std::string> TextDecoder::decode_as(
    std::string_view bytes,
    std::string_view encoding) {

    const auto name = canonical_name(encoding);
    if (!name) return std::nullopt;

    if (*name == "utf-8" || *name == "utf-8-sig") {
        return convert_to_utf8(strip_bom(bytes), icu_converter_name(*name));
    }
    if (*name == "cp1252" && has_cp1252_undefined(bytes)) {
        return std::nullopt;
    }
    return convert_to_utf8(bytes, icu_converter_name(*name));
}

Result<DecodedText> TextDecoder::decode(
    std::string_view bytes,
    const std::vector<std::string>& encodings) {

    if (encodings.empty()) {
        return Result<DecodedText>::error(ErrorCategory::CONFIG_ERROR,
            "No input encodings configured");
    }

    for (const auto& encoding : encodings) {
        const auto name = canonical_name(encoding);
        if (!name) {
            return Result<DecodedText>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unsupported encoding '{}'", encoding));
        }

        if (auto text = decode_as(bytes, *name)) {
            utils::log::debug(std::format("Decoded input as {}", *name));
            return Result<DecodedText>::ok(DecodedText{std::move(*text), *name});
        }
        utils::log::warn(std::format("Input is not valid {}, trying next encoding", *name));
    }

    return Result<DecodedText>::error(ErrorCategory::DECODE_ERROR,
        std::format("Could not decode input with any of {} configured encodings",
                    encodings.size()));
}

} // namespace piiguard
