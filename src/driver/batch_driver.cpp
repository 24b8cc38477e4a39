#include "driver/batch_driver.hpp"
#include "core/utils.hpp"
#include "io/payload_codec.hpp"
#include "io/text_decoder.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace piiguard {

namespace {

BatchProcessor::Config processor_config(const BatchConfig& batch) {
    BatchProcessor::Config cfg;
    cfg.workers = static_cast<size_t>(batch.workers < 0 ? 0 : batch.workers);
    cfg.parallel_threshold = static_cast<size_t>(batch.parallel_threshold < 1 ? 1 : batch.parallel_threshold);
    return cfg;
}

std::string delimiter_name(char delimiter) {
    if (delimiter == '\t') return "\\t";
    return std::string(1, delimiter);
}

// One output row: either an analyzed record or a payload passed through
struct OutputRow {
    std::string record_id;
    std::optional<size_t> record_index;     // Into the analyzed batch
    std::string raw_payload;                // Used when record_index is empty
};

} // anonymous namespace

BatchDriver::BatchDriver(const PiiguardConfig& config)
    : config_(config),
      processor_(processor_config(config.batch)) {}

std::string BatchDriver::read_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error(std::format("Cannot open input file: {}", path));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error(std::format("Failed reading input file: {}", path));
    }
    return bytes;
}

std::optional<size_t> BatchDriver::find_payload_column(
    const CsvTable& table,
    const std::string& configured) {

    if (!configured.empty()) {
        return table.column_index(configured);
    }
    for (size_t i = 0; i < table.header.size(); ++i) {
        if (utils::to_lower(table.header[i]).contains("json")) return i;
    }
    return std::nullopt;
}

Result<BatchSummary> BatchDriver::run(
    const std::string& input_path,
    const std::string& output_path) const {

    BatchSummary summary;
    summary.input = input_path;

    std::error_code ec;
    if (!std::filesystem::exists(input_path, ec)) {
        return Result<BatchSummary>::error(ErrorCategory::IO_ERROR,
            std::format("Input file not found: {}", input_path));
    }

    std::string bytes;
    try {
        bytes = read_file(input_path);
    } catch (const std::exception& e) {
        return Result<BatchSummary>::error(ErrorCategory::IO_ERROR, e.what());
    }

    auto decoded = TextDecoder::decode(bytes, config_.input.encodings);
    if (decoded.is_error()) {
        return Result<BatchSummary>::error(decoded.error_category(), decoded.error_message());
    }
    summary.encoding = decoded.value().encoding;
    utils::log::info(std::format("Reading {} with {} encoding", input_path, summary.encoding));

    return run_text(decoded.value().text, output_path, std::move(summary));
}

Result<BatchSummary> BatchDriver::run_text(
    std::string_view text,
    const std::string& output_path,
    BatchSummary summary) const {

    utils::Timer timer;
    summary.output = output_path;

    const char delimiter = config_.input.delimiter == "auto"
        ? CsvReader::sniff_delimiter(text)
        : ConfigLoader::delimiter_char(config_.input.delimiter);
    if (delimiter == '\0') {
        return Result<BatchSummary>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid delimiter setting '{}'", config_.input.delimiter));
    }
    summary.delimiter = delimiter_name(delimiter);

    auto parsed = CsvReader::parse(text, delimiter);
    if (parsed.is_error()) {
        return Result<BatchSummary>::error(parsed.error_category(), parsed.error_message());
    }
    const CsvTable& table = parsed.value();

    const auto payload_col = find_payload_column(table, config_.input.payload_column);
    if (!payload_col) {
        return Result<BatchSummary>::error(ErrorCategory::FORMAT_ERROR,
            config_.input.payload_column.empty()
                ? std::string("No payload column found (expected a header containing 'json')")
                : std::format("Payload column '{}' not found", config_.input.payload_column));
    }
    const auto id_col = table.column_index(config_.input.id_column);

    utils::log::debug(std::format("Payload column '{}', delimiter '{}'",
                                  table.header[*payload_col], summary.delimiter));

    // ---- Decode payloads ---------------------------------------------------

    std::vector<Record> records;
    std::vector<OutputRow> output_rows;
    records.reserve(table.rows.size());
    output_rows.reserve(table.rows.size());

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const size_t row_number = r + 1;
        ++summary.rows_read;

        const std::string& payload = row[*payload_col];
        if (utils::trim(payload).empty()) {
            if (summary.rows_skipped < kMaxSkippedRowsLogged) {
                utils::log::warn(std::format("No payload in row {}, skipping", row_number));
            }
            ++summary.rows_skipped;
            continue;
        }

        OutputRow out;
        out.record_id = id_col ? row[*id_col] : std::to_string(row_number);

        auto record = PayloadCodec::decode(payload);
        if (record.is_ok()) {
            out.record_index = records.size();
            records.push_back(std::move(record.value()));
        } else {
            utils::log::warn(std::format("Row {}: {}, passing payload through unchanged",
                                         row_number, record.error_message()));
            out.raw_payload = payload;
            ++summary.malformed_payloads;
        }
        output_rows.push_back(std::move(out));
    }

    if (summary.rows_skipped > kMaxSkippedRowsLogged) {
        utils::log::warn(std::format("{} rows without payload skipped in total", summary.rows_skipped));
    }

    // ---- Analyze -----------------------------------------------------------

    BatchStats stats;
    const auto verdicts = processor_.process(records, stats);
    for (uint64_t i = 0; i < summary.malformed_payloads; ++i) {
        stats.add(Verdict{});
    }
    stats.elapsed = timer.elapsed_us();
    SummaryReport::apply_stats(summary, stats);
    summary.generated_at = utils::format_utc_timestamp(utils::now());

    if (output_rows.empty()) {
        utils::log::warn("No records were processed; check the file format, "
                         "encoding and payload column");
        return Result<BatchSummary>::ok(std::move(summary));
    }

    // ---- Write output ------------------------------------------------------

    try {
        CsvWriter writer(output_path);
        bool ok = writer.write_row({"record_id", "redacted_data_json", "is_pii"});

        for (const auto& out : output_rows) {
            if (!ok) break;
            if (out.record_index) {
                const auto& verdict = verdicts[*out.record_index];
                ok = writer.write_row({out.record_id,
                                       PayloadCodec::encode(verdict.redacted),
                                       utils::booltostr(verdict.has_pii)});
            } else {
                ok = writer.write_row({out.record_id, out.raw_payload, "false"});
            }
        }

        if (!writer.close() || !ok) {
            return Result<BatchSummary>::error(ErrorCategory::IO_ERROR,
                std::format("Failed writing output file: {}", output_path));
        }
    } catch (const std::exception& e) {
        return Result<BatchSummary>::error(ErrorCategory::IO_ERROR, e.what());
    }

    utils::log::info(std::format("Processed {} records. Output saved to {}",
                                 summary.records, output_path));
    utils::log::info(std::format("PII detected in {} records ({:.1f}%)",
                                 summary.records_with_pii, summary.pii_percentage));

    return Result<BatchSummary>::ok(std::move(summary));
}

} // namespace piiguard
