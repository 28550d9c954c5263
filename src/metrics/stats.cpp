/**
 * @file stats.cpp
 * @brief Statistics aggregation and reporting
 */

#include <cpe/metrics/stats.hpp>
#include <cpe/logging/async_logger.hpp>

#include <iomanip>
#include <ostream>

namespace cpe {

void StatsSnapshot::accumulate(const ShardStats& stats) noexcept {
    events_received += stats.events_received.load(std::memory_order_relaxed);
    accounts_created += stats.accounts_created.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < APPLY_RESULT_COUNT; ++i) {
        outcomes[i] += stats.outcomes[i].load(std::memory_order_relaxed);
    }
}

void StatsSnapshot::print(std::ostream& os) const {
    os << "\n=== Engine Statistics ===\n";
    os << "  Events:       " << events_received << "\n";
    os << "  Accounts:     " << accounts_created << "\n";
    for (std::size_t i = 0; i < APPLY_RESULT_COUNT; ++i) {
        os << "  " << std::left << std::setw(20) << to_string(static_cast<ApplyResult>(i))
           << outcomes[i] << "\n";
    }
    os << "  Elapsed:      " << std::fixed << std::setprecision(3)
       << ns_to_ms(elapsed_ns) << " ms\n";
    os << "=========================\n";
}

void StatsSnapshot::log(AsyncLogger& logger) const {
    logger.info("run summary: events=%llu accounts=%llu applied=%llu ignored=%llu elapsed_ms=%.3f",
                static_cast<unsigned long long>(events_received),
                static_cast<unsigned long long>(accounts_created),
                static_cast<unsigned long long>(count(ApplyResult::Applied)),
                static_cast<unsigned long long>(ignored()),
                ns_to_ms(elapsed_ns));
    for (std::size_t i = 1; i < APPLY_RESULT_COUNT; ++i) {
        if (outcomes[i] == 0) continue;
        logger.info("  ignored %s: %llu",
                    to_string(static_cast<ApplyResult>(i)),
                    static_cast<unsigned long long>(outcomes[i]));
    }
}

} // namespace cpe
