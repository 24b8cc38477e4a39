#pragma once

#include "core/error.hpp"

#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// CsvTable - parsed delimited text
// ============================================================================

struct CsvTable {
    char delimiter = ',';
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;     // Each row has header.size() cells

    // Index of the first column with this exact name
    [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const;
};

// ============================================================================
// CsvReader
// ============================================================================

/**
 * @brief RFC 4180 style reader
 *
 * Quoted fields may hold the delimiter, doubled quotes and line breaks.
 * CRLF and LF line endings are both accepted; blank lines are skipped.
 * Rows shorter than the header are padded with empty cells, longer rows
 * are cut to the header width.
 */
class CsvReader {
public:
    /**
     * @brief ';' when the first line has no ',' but has ';', otherwise ','
     */
    [[nodiscard]] static char sniff_delimiter(std::string_view text);

    /**
     * @brief Parse text; the first record is the header
     * @return FORMAT_ERROR for empty input or an unterminated quoted field
     */
    [[nodiscard]] static Result<CsvTable> parse(std::string_view text, char delimiter);

    /**
     * @brief Split into raw records without header handling
     */
    [[nodiscard]] static Result<std::vector<std::vector<std::string>>> split_records(
        std::string_view text, char delimiter);
};

// ============================================================================
// CsvWriter
// ============================================================================

/**
 * @brief Delimited text writer, one record per line terminated by '\n'
 *
 * A cell is quoted when it holds the delimiter, a quote, CR or LF;
 * embedded quotes are doubled.
 */
class CsvWriter {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit CsvWriter(const std::string& path, char delimiter = ',');
    ~CsvWriter();

    CsvWriter(const CsvWriter&) = delete;
    CsvWriter& operator=(const CsvWriter&) = delete;

    [[nodiscard]] bool write_row(const std::vector<std::string>& cells);

    /**
     * @brief Flush and close; false if any write failed
     */
    [[nodiscard]] bool close();

    [[nodiscard]] size_t rows_written() const { return rows_written_; }

    [[nodiscard]] static std::string format_row(const std::vector<std::string>& cells, char delimiter);
    [[nodiscard]] static std::string quote_cell(std::string_view cell, char delimiter);

private:
    std::ofstream out_;
    char delimiter_;
    size_t rows_written_ = 0;
};

} // namespace piiguard
