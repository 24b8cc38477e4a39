#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "io/text_decoder.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::array& arr) {
    std::vector<std::string> result;
    result.reserve(arr.size());
    for (const auto& elem : arr) {
        if (const auto* s = elem.as_string()) {
            result.emplace_back(s->get());
        }
    }
    return result;
}

int toml_int(const toml::table& tbl, std::string_view key, int fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v < INT32_MIN || *v > INT32_MAX) {
        throw std::runtime_error(std::format("{} is out of range: {}", key, *v));
    }
    return static_cast<int>(*v);
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

InputConfig extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;
    const auto& in = *input;

    cfg.delimiter = in["delimiter"].value_or("auto"s);
    if (const auto* arr = in["encodings"].as_array()) {
        cfg.encodings = toml_string_array(*arr);
    }
    cfg.id_column = in["id_column"].value_or("record_id"s);
    cfg.payload_column = in["payload_column"].value_or(""s);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    cfg.path = (*output)["path"].value_or("redacted_output.csv"s);
    return cfg;
}

BatchConfig extract_batch(const toml::table& root) {
    BatchConfig cfg;
    const auto* batch = root["batch"].as_table();
    if (!batch) return cfg;
    const auto& b = *batch;

    cfg.workers = toml_int(b, "workers", cfg.workers);
    cfg.parallel_threshold = toml_int(b, "parallel_threshold", cfg.parallel_threshold);
    return cfg;
}

PiiguardConfig extract_all_sections(const toml::table& tbl) {
    PiiguardConfig config;
    config.logging = extract_logging(tbl);
    config.input = extract_input(tbl);
    config.output = extract_output(tbl);
    config.batch = extract_batch(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

char ConfigLoader::delimiter_char(const std::string& setting) {
    if (setting == ",") return ',';
    if (setting == ";") return ';';
    if (setting == "\t" || setting == "\\t" || setting == "tab") return '\t';
    if (setting == "|") return '|';
    return '\0';
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PiiguardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PiiguardConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.input.delimiter != "auto" && delimiter_char(config.input.delimiter) == '\0') {
        errors.push_back(std::format(
            "input.delimiter must be auto, ',', ';', '\\t' or '|', got '{}'",
            config.input.delimiter));
    }

    if (config.input.encodings.empty()) {
        errors.push_back("input.encodings must not be empty");
    }
    for (const auto& encoding : config.input.encodings) {
        if (!TextDecoder::is_supported(encoding)) {
            errors.push_back(std::format("input.encodings: unsupported encoding '{}'", encoding));
        }
    }

    if (config.input.id_column.empty()) {
        errors.push_back("input.id_column must not be empty");
    }

    if (config.output.path.empty()) {
        errors.push_back("output.path must not be empty");
    }

    if (!utils::in_range<0, 256>(config.batch.workers)) {
        errors.push_back(std::format("batch.workers must be 0-256, got {}", config.batch.workers));
    }

    if (config.batch.parallel_threshold < 1) {
        errors.push_back(std::format(
            "batch.parallel_threshold must be >= 1, got {}", config.batch.parallel_threshold));
    }

    return errors;
}

} // namespace piiguard
