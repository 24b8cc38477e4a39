#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "driver/batch_driver.hpp"
#include "report/summary_report.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace piiguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::optional<std::string> report;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: piiguard <input.csv> [options]\n"
          "\n"
          "Detect and redact PII in a CSV file whose payload column holds JSON objects.\n"
          "\n"
          "Options:\n"
          "  -o, --output FILE   Output CSV (default: redacted_output.csv)\n"
          "  -c, --config FILE   TOML configuration file\n"
          "  -r, --report FILE   Write a JSON run summary\n"
          "  -h, --help          Show this help\n";
}

// nullopt on a usage error (message already printed)
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto take_value = [&](std::optional<std::string>& target) -> bool {
            if (i + 1 >= argc) {
                std::cerr << std::format("piiguard: option {} requires a value\n", arg);
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else if (arg == "-o" || arg == "--output") {
            if (!take_value(opts.output)) return std::nullopt;
        } else if (arg == "-c" || arg == "--config") {
            if (!take_value(opts.config)) return std::nullopt;
        } else if (arg == "-r" || arg == "--report") {
            if (!take_value(opts.report)) return std::nullopt;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            std::cerr << std::format("piiguard: unknown option {}\n", arg);
            return std::nullopt;
        } else if (opts.input.empty()) {
            opts.input = std::string(arg);
        } else {
            std::cerr << std::format("piiguard: unexpected argument {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.input.empty()) {
        std::cerr << "piiguard: missing input file\n";
        return std::nullopt;
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (opts->help) {
        print_usage(std::cout);
        return kExitOk;
    }

    try {
        PiiguardConfig config;
        if (opts->config) {
            auto loaded = ConfigLoader::load_from_file(*opts->config);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitFailure;
            }
            config = std::move(loaded.config);
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (opts->output) {
            config.output.path = *opts->output;
        }

        utils::log::info(std::format("Starting PII detection for {}", opts->input));

        BatchDriver driver(config);
        auto result = driver.run(opts->input, config.output.path);
        if (result.is_error()) {
            utils::log::error(std::format("{} error: {}",
                error_category_name(result.error_category()), result.error_message()));
            return kExitFailure;
        }

        if (opts->report) {
            auto written = SummaryReport::write_file(result.value(), *opts->report);
            if (written.is_error()) {
                utils::log::error(written.error_message());
                return kExitFailure;
            }
            utils::log::info(std::format("Summary report written to {}", *opts->report));
        }

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
