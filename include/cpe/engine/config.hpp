#pragma once
/**
 * @file config.hpp
 * @brief Run configuration shared by the dispatcher, engine and CLI
 */

#include <cpe/common/types.hpp>
#include <cpe/concurrency/pinning.hpp>
#include <cpe/logging/async_logger.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cpe {

/**
 * @brief Order of rows handed to the output collaborator
 */
enum class SnapshotOrder : std::uint8_t {
    Unordered = 0,   // Shard walk order
    ByClientId = 1   // Ascending client id
};

/**
 * @brief One shard per hardware thread, capped to the client id space
 */
[[nodiscard]] inline std::size_t default_shard_count() noexcept {
    return std::clamp<std::size_t>(get_num_cores(), 1, constants::CLIENT_ID_SPACE);
}

/**
 * @brief Configuration for a payments run
 */
struct EngineConfig {
    // Partitioning
    std::size_t shard_count{default_shard_count()};

    // Thread affinity: worker i is pinned to core i % cores
    bool pin_threads{false};

    // How long a blocked queue hand-off waits before re-checking for abort
    std::chrono::milliseconds poll_interval{10};

    // Output
    SnapshotOrder snapshot_order{SnapshotOrder::Unordered};

    // Logging
    std::string log_file;
    LogLevel log_level{LogLevel::Info};

    EngineConfig() = default;
};

} // namespace cpe
