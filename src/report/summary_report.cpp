#include "report/summary_report.hpp"

#include <glaze/glaze.hpp>

#include <format>
#include <fstream>

namespace piiguard {

void SummaryReport::apply_stats(BatchSummary& summary, const BatchStats& stats) {
    summary.records = stats.records;
    summary.records_with_pii = stats.records_with_pii;
    summary.fields_redacted = stats.fields_redacted;
    summary.pii_percentage = stats.pii_percentage();
    summary.elapsed_ms = static_cast<double>(stats.elapsed.count()) / 1000.0;

    summary.redactions_by_category.clear();
    for (const auto c : kAllCategories) {
        summary.redactions_by_category[std::string(category_name(c))] = stats.count(c);
    }
}

std::string SummaryReport::to_json(const BatchSummary& summary) {
    std::string buffer;
    auto ec = glz::write<glz::opts{.prettify = true}>(summary, buffer);
    if (ec) {
        return std::format(R"({{"error":"{}"}})", glz::format_error(ec, buffer));
    }
    return buffer;
}

Result<bool> SummaryReport::write_file(const BatchSummary& summary, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        return Result<bool>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to open report file: {}", path));
    }

    out << to_json(summary) << '\n';
    out.flush();
    if (!out.good()) {
        return Result<bool>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to write report file: {}", path));
    }
    return Result<bool>::ok(true);
}

} // namespace piiguard
