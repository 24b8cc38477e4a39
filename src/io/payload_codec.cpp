#include "io/payload_codec.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <format>

namespace piiguard {

using json = nlohmann::ordered_json;

namespace {

[[nodiscard]] FieldValue to_field_value(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return FieldValue::null();
        case json::value_t::string:
            return FieldValue(value.get<std::string>());
        case json::value_t::boolean:
            return FieldValue(ValueKind::BOOLEAN, value.get<bool>() ? "true" : "false");
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return FieldValue(ValueKind::INTEGER, value.dump());
        case json::value_t::number_float:
            return FieldValue(ValueKind::FLOAT, value.dump());
        default:
            return FieldValue::null();
    }
}

// Numbers go back as numbers when their text still parses, else as strings
[[nodiscard]] json to_json_value(const FieldValue& value) {
    const auto& text = value.text;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    switch (value.kind) {
        case ValueKind::NULL_VALUE:
            return nullptr;
        case ValueKind::STRING:
            return text;
        case ValueKind::BOOLEAN:
            return text == "true";
        case ValueKind::INTEGER: {
            if (!text.empty() && text.front() == '-') {
                int64_t n = 0;
                const auto [ptr, ec] = std::from_chars(first, last, n);
                if (ec == std::errc() && ptr == last) return n;
            } else {
                uint64_t n = 0;
                const auto [ptr, ec] = std::from_chars(first, last, n);
                if (ec == std::errc() && ptr == last) return n;
            }
            return text;
        }
        case ValueKind::FLOAT: {
            double d = 0.0;
            const auto [ptr, ec] = std::from_chars(first, last, d);
            if (ec == std::errc() && ptr == last) return d;
            return text;
        }
    }
    return text;
}

} // anonymous namespace

Result<Record> PayloadCodec::decode(std::string_view text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        return Result<Record>::error(ErrorCategory::DECODE_ERROR,
            std::format("Malformed JSON payload: {}", e.what()));
    }

    if (!parsed.is_object()) {
        return Result<Record>::error(ErrorCategory::FORMAT_ERROR,
            std::format("Payload is a JSON {}, expected an object", parsed.type_name()));
    }

    Record record;
    for (const auto& [key, value] : parsed.items()) {
        if (value.is_structured()) {
            return Result<Record>::error(ErrorCategory::FORMAT_ERROR,
                std::format("Field '{}' holds a nested {}", key, value.type_name()));
        }
        record.set(key, to_field_value(value));
    }

    return Result<Record>::ok(std::move(record));
}

std::string PayloadCodec::encode(const Record& record) {
    json out = json::object();
    for (const auto& field : record) {
        out[field.key] = to_json_value(field.value);
    }
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace piiguard
