#include "io/csv.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace piiguard {

// ============================================================================
// CsvTable
// ============================================================================

std::optional<size_t> CsvTable::column_index(std::string_view name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return i;
    }
    return std::nullopt;
}

// ============================================================================
// CsvReader
// ============================================================================

char CsvReader::sniff_delimiter(std::string_view text) {
    const auto eol = text.find_first_of("\r\n");
    const auto first_line = text.substr(0, eol);
    if (!first_line.contains(',') && first_line.contains(';')) {
        return ';';
    }
    return ',';
}

Result<std::vector<std::vector<std::string>>> CsvReader::split_records(
    std::string_view text, char delimiter) {

    using RecordsResult = Result<std::vector<std::vector<std::string>>>;

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool row_has_data = false;          // Distinguishes "" rows from blank lines
    size_t line = 1;
    size_t quote_line = 0;

    auto end_cell = [&]() {
        row.push_back(std::move(cell));
        cell.clear();
    };

    auto end_row = [&]() {
        if (row_has_data || !cell.empty() || !row.empty()) {
            end_cell();
            records.push_back(std::move(row));
        }
        row.clear();
        cell.clear();
        row_has_data = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                cell.push_back(c);
            }
            continue;
        }

        if (c == '"' && cell.empty()) {
            in_quotes = true;
            row_has_data = true;
            quote_line = line;
        } else if (c == delimiter) {
            end_cell();
            row_has_data = true;
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_row();
            ++line;
        } else if (c == '\n') {
            end_row();
            ++line;
        } else {
            cell.push_back(c);
        }
    }

    if (in_quotes) {
        return RecordsResult::error(ErrorCategory::FORMAT_ERROR,
            std::format("Unterminated quoted field starting on line {}", quote_line));
    }
    end_row();

    return RecordsResult::ok(std::move(records));
}

Result<CsvTable> CsvReader::parse(std::string_view text, char delimiter) {
    auto split = split_records(text, delimiter);
    if (split.is_error()) {
        return Result<CsvTable>::error(split.error_category(), split.error_message());
    }

    auto& records = split.value();
    if (records.empty()) {
        return Result<CsvTable>::error(ErrorCategory::FORMAT_ERROR, "Input has no header row");
    }

    CsvTable table;
    table.delimiter = delimiter;
    table.header.reserve(records[0].size());
    for (const auto& name : records[0]) {
        table.header.push_back(utils::trim(name));
    }

    const size_t width = table.header.size();
    table.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        auto& row = records[r];
        row.resize(width);
        table.rows.push_back(std::move(row));
    }

    return Result<CsvTable>::ok(std::move(table));
}

// ============================================================================
// CsvWriter
// ============================================================================

CsvWriter::CsvWriter(const std::string& path, char delimiter)
    : delimiter_(delimiter) {
    out_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
}

CsvWriter::~CsvWriter() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

std::string CsvWriter::quote_cell(std::string_view cell, char delimiter) {
    const bool needs_quotes = cell.find(delimiter) != std::string_view::npos ||
                              cell.find_first_of("\"\r\n") != std::string_view::npos;
    if (!needs_quotes) return std::string(cell);

    std::string out;
    out.reserve(cell.size() + 8);
    out.push_back('"');
    for (const char c : cell) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string CsvWriter::format_row(const std::vector<std::string>& cells, char delimiter) {
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) line.push_back(delimiter);
        line += quote_cell(cells[i], delimiter);
    }
    line.push_back('\n');
    return line;
}

bool CsvWriter::write_row(const std::vector<std::string>& cells) {
    const auto line = format_row(cells, delimiter_);
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out_.good()) return false;
    ++rows_written_;
    return true;
}

bool CsvWriter::close() {
    if (!out_.is_open()) return true;
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    return ok && !out_.fail();
}

} // namespace piiguard
