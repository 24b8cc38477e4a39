#pragma once

#include "classifier/record_analyzer.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <vector>

namespace piiguard {

/**
 * @brief Runs the record analyzer over a batch, in parallel when it pays off
 *
 * Below parallel_threshold records the batch runs on the calling thread.
 * Above it, records are split into contiguous chunks, one per worker
 * (std::async). Each verdict is written to the slot of its source record,
 * so output order always equals input order.
 */
class BatchProcessor {
public:
    struct Config {
        size_t workers = 0;                 // 0 = hardware concurrency
        size_t parallel_threshold = 1000;
    };

    static constexpr size_t kMaxAutoWorkers = 8;

    BatchProcessor() = default;
    explicit BatchProcessor(const Config& config) : config_(config) {}

    [[nodiscard]] std::vector<Verdict> process(const std::vector<Record>& records) const;

    /**
     * @brief process() plus aggregate statistics
     */
    [[nodiscard]] std::vector<Verdict> process(
        const std::vector<Record>& records,
        BatchStats& stats) const;

    // Worker count actually used for a batch of n records
    [[nodiscard]] size_t effective_workers(size_t n) const;

    [[nodiscard]] const RecordAnalyzer& analyzer() const { return analyzer_; }

private:
    Config config_;
    RecordAnalyzer analyzer_;
};

} // namespace piiguard
