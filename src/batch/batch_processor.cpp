#include "batch/batch_processor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <thread>

namespace piiguard {

size_t BatchProcessor::effective_workers(size_t n) const {
    if (n < config_.parallel_threshold) return 1;

    size_t workers = config_.workers;
    if (workers == 0) {
        const unsigned hw_threads = std::thread::hardware_concurrency();
        workers = std::min<size_t>(hw_threads == 0 ? 1 : hw_threads, kMaxAutoWorkers);
    }
    return std::max<size_t>(1, std::min(workers, n));
}

std::vector<Verdict> BatchProcessor::process(const std::vector<Record>& records) const {
    const size_t num_records = records.size();
    std::vector<Verdict> verdicts(num_records);

    // Analyze records [start, end) into their own slots
    auto analyze_range = [&](size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            verdicts[i] = analyzer_.analyze(records[i]);
        }
    };

    const size_t num_workers = effective_workers(num_records);
    if (num_workers > 1) {
        const size_t chunk = (num_records + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_records);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, analyze_range, start, end));
        }
        for (auto& f : futures) f.get();

        utils::log::debug(std::format("Analyzed {} records on {} workers",
                                      num_records, futures.size()));
    } else {
        analyze_range(0, num_records);
    }

    return verdicts;
}

std::vector<Verdict> BatchProcessor::process(
    const std::vector<Record>& records,
    BatchStats& stats) const {

    utils::Timer timer;
    auto verdicts = process(records);
    for (const auto& v : verdicts) {
        stats.add(v);
    }
    stats.elapsed += timer.elapsed_us();
    return verdicts;
}

} // namespace piiguard
