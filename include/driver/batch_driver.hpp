#pragma once

#include "batch/batch_processor.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "io/csv.hpp"
#include "report/summary_report.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief End-to-end batch run: CSV of JSON payloads in, redacted CSV out
 *
 * Pipeline: read bytes -> decode text -> parse CSV -> locate id and payload
 * columns -> decode payloads -> analyze (BatchProcessor) -> write output.
 *
 * Output header is record_id,redacted_data_json,is_pii. Rows keep input
 * order. A row whose payload is malformed JSON or not a flat object is
 * written with its payload text unchanged and is_pii=false. Rows without a
 * payload value are skipped. When no row produces output, no file is
 * written.
 */
class BatchDriver {
public:
    static constexpr size_t kMaxSkippedRowsLogged = 5;

    explicit BatchDriver(const PiiguardConfig& config);

    [[nodiscard]] Result<BatchSummary> run(
        const std::string& input_path,
        const std::string& output_path) const;

    /**
     * @brief Same as run(), on text already decoded to UTF-8
     */
    [[nodiscard]] Result<BatchSummary> run_text(
        std::string_view text,
        const std::string& output_path,
        BatchSummary summary) const;

    /**
     * @brief Payload column: configured name, else first header containing
     * "json" (case-insensitive)
     */
    [[nodiscard]] static std::optional<size_t> find_payload_column(
        const CsvTable& table,
        const std::string& configured);

    [[nodiscard]] static std::string read_file(const std::string& path);

private:
    PiiguardConfig config_;
    BatchProcessor processor_;
};

} // namespace piiguard
