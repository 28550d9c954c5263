/**
 * @file generate_csv.cpp
 * @brief Emit a large, valid payments CSV for load testing
 *
 * Usage:
 *   generate_csv --rows N [--clients C] [--disputes] > big.csv
 *
 * Row i (1-based) belongs to client i % C and uses tx id i. Without
 * --disputes every row is a deposit of 1.0. With --disputes, rows ending in
 * 5 are small withdrawals and rows ending in 0 dispute the previous row's
 * deposit, so every dispute and withdrawal stays valid.
 */

#include <cpe/common/types.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

using namespace cpe;

static constexpr std::uint64_t DEFAULT_ROWS = 1'000'000;
static constexpr std::uint64_t DEFAULT_CLIENTS = 128;

struct Config {
    std::uint64_t rows{DEFAULT_ROWS};
    std::uint64_t clients{DEFAULT_CLIENTS};
    bool disputes{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] > out.csv\n"
              << "\nOptions:\n"
              << "  --rows N        Number of rows (default: " << DEFAULT_ROWS << ")\n"
              << "  --clients C     Number of distinct clients (default: " << DEFAULT_CLIENTS << ")\n"
              << "  --disputes      Mix in withdrawals and disputes\n"
              << "  --help          Show this help message\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--rows" && i + 1 < argc) {
            config.rows = std::stoull(argv[++i]);
        } else if (arg == "--clients" && i + 1 < argc) {
            config.clients = std::stoull(argv[++i]);
        } else if (arg == "--disputes") {
            config.disputes = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "error: unknown or incomplete option '" << arg << "'\n";
            print_usage(argv[0]);
            std::exit(2);
        }
    }

    return config;
}

int main(int argc, char* argv[]) {
    try {
        Config config = parse_args(argc, argv);

        if (config.clients == 0 || config.clients > constants::CLIENT_ID_SPACE) {
            std::cerr << "error: --clients must be in [1, " << constants::CLIENT_ID_SPACE << "]\n";
            return 2;
        }
        if (config.rows > std::numeric_limits<std::uint32_t>::max()) {
            std::cerr << "error: --rows exceeds the transaction id range\n";
            return 2;
        }

        std::ios::sync_with_stdio(false);
        std::cout << "type,client,tx,amount\n";

        for (std::uint64_t i = 1; i <= config.rows; ++i) {
            const std::uint64_t client = i % config.clients;

            if (config.disputes && i % 10 == 0) {
                std::cout << "dispute," << (i - 1) % config.clients << ',' << (i - 1) << ",\n";
            } else if (config.disputes && i % 10 == 5) {
                std::cout << "withdrawal," << client << ',' << i << ",0.0001\n";
            } else {
                std::cout << "deposit," << client << ',' << i << ",1\n";
            }
        }

        std::cout.flush();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
