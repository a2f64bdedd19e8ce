/// @file src/main.cpp
/// @brief invest_meeting CLI entry point.
///
/// Usage:
///   invest_meeting SYMBOL... [--start YYYY-MM-DD] [--end YYYY-MM-DD]
///                  [--interval 1d|1wk|1mo] [--data-dir DIR]
///                  [--output FILE] [--parallel] [--verbose]

#include "invest/agents.hpp"
#include "invest/market_data.hpp"
#include "invest/meeting.hpp"
#include "invest/serialization.hpp"

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  invest_meeting SYMBOL... [options]\n"
        "\n"
        "Options:\n"
        "  --start YYYY-MM-DD     First day of history   (default 2023-01-01)\n"
        "  --end YYYY-MM-DD       Last day of history    (default 2023-12-31)\n"
        "  --interval 1d|1wk|1mo  Bar interval           (default 1d)\n"
        "  --data-dir DIR         Read <SYMBOL>.csv etc. from DIR\n"
        "                         (synthetic offline data when omitted)\n"
        "  --output FILE          Write decisions JSON to FILE instead of stdout\n"
        "  --parallel             Run the agents concurrently\n"
        "  --verbose              Debug logging\n"
        "  --help                 Show this help\n");
}

struct Options {
    std::vector<std::string>   symbols;
    std::string                start = "2023-01-01";
    std::string                end   = "2023-12-31";
    std::string                interval = "1d";
    std::optional<std::string> data_dir;
    std::optional<std::string> output;
    bool                       parallel = false;
    bool                       verbose  = false;
    bool                       help     = false;
};

/// Parse argv; `nullopt` on a usage error (already reported).
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);

        auto take_value = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--start") {
            if (!take_value(opts.start)) return std::nullopt;
        } else if (arg == "--end") {
            if (!take_value(opts.end)) return std::nullopt;
        } else if (arg == "--interval") {
            if (!take_value(opts.interval)) return std::nullopt;
        } else if (arg == "--data-dir") {
            std::string dir;
            if (!take_value(dir)) return std::nullopt;
            opts.data_dir = dir;
        } else if (arg == "--output") {
            std::string path;
            if (!take_value(path)) return std::nullopt;
            opts.output = path;
        } else if (arg == "--parallel") {
            opts.parallel = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            opts.symbols.push_back(arg);
        }
    }
    return opts;
}

/// Run the meeting and emit JSON.  Returns the process exit code.
int run_meeting(const Options& opts) {
    const auto start    = invest::parse_iso_date(opts.start);
    const auto end      = invest::parse_iso_date(opts.end);
    const auto interval = invest::parse_interval(opts.interval);
    if (!start || !end) {
        fmt::print(stderr, "Error: dates must be YYYY-MM-DD (got '{}', '{}')\n",
                   opts.start, opts.end);
        return 1;
    }
    if (*end < *start) {
        fmt::print(stderr, "Error: --end precedes --start\n");
        return 1;
    }
    if (!interval) {
        fmt::print(stderr, "Error: unsupported interval '{}'\n", opts.interval);
        return 1;
    }

    std::unique_ptr<invest::core::MarketDataProvider> data;
    if (opts.data_dir) {
        data = std::make_unique<invest::core::CsvMarketData>(*opts.data_dir);
    } else {
        spdlog::info("No --data-dir given; using synthetic offline data");
        data = std::make_unique<invest::core::SyntheticMarketData>();
    }

    invest::core::MeetingConfig config;
    config.interval        = *interval;
    config.parallel_agents = opts.parallel;

    const invest::core::MeetingOrchestrator meeting(
        *data, invest::agents::default_agents(), config);
    const auto result = meeting.run(opts.symbols, *start, *end);

    const std::string json = invest::io::dump_result(result);
    if (opts.output) {
        std::ofstream out(*opts.output);
        if (!out.is_open()) {
            fmt::print(stderr, "Error: cannot write '{}'\n", *opts.output);
            return 1;
        }
        out << json << '\n';
        fmt::print(stderr, "Saved decisions to {}\n", *opts.output);
    } else {
        fmt::print("{}\n", json);
    }

    return invest::core::successful_count(result) > 0 ? 0 : 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("invest"));

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (opts->help) {
        print_usage();
        return 0;
    }
    if (opts->symbols.empty()) {
        fmt::print(stderr, "Error: at least one symbol is required\n");
        print_usage();
        return 1;
    }

    spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::info);
    return run_meeting(*opts);
}
