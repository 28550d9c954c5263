/**
 * @file main.cpp
 * @brief Main entry point for the Concurrent Payments Engine
 *
 * Usage:
 *   cpe_engine <input.csv> [options] > accounts.csv
 *
 * CLI flags:
 *   --shards N        Number of account shards / worker threads
 *   --pin             Enable thread pinning
 *   --sorted          Emit rows in ascending client order
 *   --log FILE        Log file path
 *   --log-level L     debug | info | warn | error
 */

#include <cpe/common/types.hpp>
#include <cpe/concurrency/pinning.hpp>
#include <cpe/engine/config.hpp>
#include <cpe/engine/payments_engine.hpp>
#include <cpe/io/balance_writer.hpp>
#include <cpe/io/csv_reader.hpp>
#include <cpe/logging/async_logger.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace cpe;

static constexpr int EXIT_FATAL = 1;
static constexpr int EXIT_USAGE = 2;

struct CliOptions {
    std::string input_file;
    EngineConfig engine;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input.csv> [options]\n"
              << "\nOptions:\n"
              << "  --shards N        Number of shards (default: " << default_shard_count() << ")\n"
              << "  --pin             Enable thread pinning\n"
              << "  --sorted          Emit rows in ascending client order\n"
              << "  --log FILE        Log file path (default: none)\n"
              << "  --log-level L     debug, info, warn or error (default: info)\n"
              << "  --help            Show this help message\n";
}

[[noreturn]] void usage_error(const char* program, const std::string& message) {
    std::cerr << "error: " << message << "\n";
    print_usage(program);
    std::exit(EXIT_USAGE);
}

std::optional<std::size_t> parse_count(std::string_view s) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--shards" && i + 1 < argc) {
            auto shards = parse_count(argv[++i]);
            if (!shards || *shards == 0 || *shards > constants::CLIENT_ID_SPACE) {
                usage_error(argv[0], "invalid shard count '" + std::string(argv[i]) + "'");
            }
            options.engine.shard_count = *shards;
        } else if (arg == "--pin") {
            options.engine.pin_threads = true;
        } else if (arg == "--sorted") {
            options.engine.snapshot_order = SnapshotOrder::ByClientId;
        } else if (arg == "--log" && i + 1 < argc) {
            options.engine.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = parse_log_level(argv[++i]);
            if (!level) {
                usage_error(argv[0], "invalid log level '" + std::string(argv[i]) + "'");
            }
            options.engine.log_level = *level;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            usage_error(argv[0], "unknown or incomplete option '" + arg + "'");
        } else if (options.input_file.empty()) {
            options.input_file = arg;
        } else {
            usage_error(argv[0], "unexpected argument '" + arg + "'");
        }
    }

    if (options.input_file.empty()) {
        usage_error(argv[0], "missing input file");
    }
    return options;
}

int main(int argc, char* argv[]) {
    CliOptions options = parse_args(argc, argv);

    try {
        std::ifstream input(options.input_file);
        if (!input.is_open()) {
            std::cerr << "error: could not open file: " << options.input_file << "\n";
            return EXIT_FATAL;
        }

        // Create optional logger
        std::unique_ptr<AsyncLogger> logger;
        if (!options.engine.log_file.empty()) {
            logger = std::make_unique<AsyncLogger>(options.engine.log_file, options.engine.log_level);
            logger->info("input=%s shards=%zu pinning=%s cores=%u",
                         options.input_file.c_str(), options.engine.shard_count,
                         options.engine.pin_threads ? "on" : "off", get_num_cores());
        }

        CsvEventReader reader(input);
        PaymentsEngine engine(options.engine, logger.get());
        RunResult result = engine.run(reader);

        if (!result.success()) {
            std::cerr << "error: " << result.message << "\n";
            return EXIT_FATAL;
        }

        write_balances(std::cout, result.balances);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FATAL;
    }
}
