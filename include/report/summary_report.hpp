#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace piiguard {

/**
 * @brief Outcome of one batch run, as written to the summary report
 */
struct BatchSummary {
    std::string input;
    std::string output;
    std::string encoding;
    std::string delimiter;
    uint64_t rows_read = 0;
    uint64_t rows_skipped = 0;              // No payload value
    uint64_t malformed_payloads = 0;        // Passed through unchanged
    uint64_t records = 0;
    uint64_t records_with_pii = 0;
    uint64_t fields_redacted = 0;
    double pii_percentage = 0.0;
    std::map<std::string, uint64_t> redactions_by_category;
    double elapsed_ms = 0.0;
    std::string generated_at;               // UTC, ISO-8601
};

/**
 * @brief BatchSummary -> JSON (glaze)
 */
class SummaryReport {
public:
    /**
     * @brief Fill the counters of a summary from batch statistics
     */
    static void apply_stats(BatchSummary& summary, const BatchStats& stats);

    [[nodiscard]] static std::string to_json(const BatchSummary& summary);

    /**
     * @return IO_ERROR if the file cannot be written
     */
    [[nodiscard]] static Result<bool> write_file(const BatchSummary& summary, const std::string& path);
};

} // namespace piiguard
