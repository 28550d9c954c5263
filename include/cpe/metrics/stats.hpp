#pragma once
/**
 * @file stats.hpp
 * @brief Per-shard event counters
 *
 * Counters are written only by the owning shard worker and may be read
 * from any thread while the run is in progress.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/time.hpp>
#include <cpe/common/macros.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace cpe {

class AsyncLogger;

/**
 * @brief Shard statistics container
 *
 * Uses cache-line alignment to avoid false sharing between shards.
 */
struct ShardStats {
    CPE_CACHE_ALIGNED std::atomic<std::uint64_t> events_received{0};
    CPE_CACHE_ALIGNED std::atomic<std::uint64_t> accounts_created{0};
    std::array<std::atomic<std::uint64_t>, APPLY_RESULT_COUNT> outcomes{};

    ShardStats() = default;

    // Non-copyable due to atomics
    ShardStats(const ShardStats&) = delete;
    ShardStats& operator=(const ShardStats&) = delete;

    void record(ApplyResult result) noexcept {
        outcomes[static_cast<std::size_t>(result)].fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t count(ApplyResult result) const noexcept {
        return outcomes[static_cast<std::size_t>(result)].load(std::memory_order_relaxed);
    }
};

/**
 * @brief Plain aggregate of one or more ShardStats, for reporting
 */
struct StatsSnapshot {
    std::uint64_t events_received{0};
    std::uint64_t accounts_created{0};
    std::array<std::uint64_t, APPLY_RESULT_COUNT> outcomes{};
    Duration elapsed_ns{0};

    [[nodiscard]] std::uint64_t count(ApplyResult result) const noexcept {
        return outcomes[static_cast<std::size_t>(result)];
    }

    [[nodiscard]] std::uint64_t ignored() const noexcept {
        return events_received - count(ApplyResult::Applied);
    }

    /**
     * @brief Add the current values of a shard's counters
     */
    void accumulate(const ShardStats& stats) noexcept;

    void print(std::ostream& os) const;

    void log(AsyncLogger& logger) const;
};

} // namespace cpe
