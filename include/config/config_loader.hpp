#pragma once

#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct InputConfig {
    std::string delimiter = "auto";                 // auto | "," | ";" | "\t" | "|"
    std::vector<std::string> encodings = {"utf-8", "utf-8-sig", "latin-1", "cp1252"};
    std::string id_column = "record_id";
    std::string payload_column;                     // Empty = first column containing "json"
};

struct OutputConfig {
    std::string path = "redacted_output.csv";
};

struct BatchConfig {
    int workers = 0;                                // 0 = hardware concurrency
    int parallel_threshold = 1000;
};

// ============================================================================
// PiiguardConfig - Complete parsed configuration
// ============================================================================

struct PiiguardConfig {
    LoggingConfig logging;
    InputConfig input;
    OutputConfig output;
    BatchConfig batch;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads piiguard.toml
 *
 * ${VAR} references in any string value are replaced with the environment
 * variable's value (empty when unset). Missing sections and keys keep
 * their defaults. All validation errors are reported together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        PiiguardConfig config;

        static LoadResult ok(PiiguardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to piiguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config; empty result means valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PiiguardConfig& config);

    /**
     * @brief Delimiter setting -> character; '\0' for "auto" or an invalid value
     */
    [[nodiscard]] static char delimiter_char(const std::string& setting);

    /**
     * @brief Replace ${VAR} with environment values
     * @throws std::runtime_error on an unclosed ${
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static LoadResult validate_and_return(PiiguardConfig config);
};

} // namespace piiguard
