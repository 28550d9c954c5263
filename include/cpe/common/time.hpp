#pragma once
/**
 * @file time.hpp
 * @brief Timing utilities for log timestamps and run statistics
 */

#include <chrono>
#include <cstdint>

namespace cpe {

/// Nanosecond timestamp type
using Timestamp = std::uint64_t;

/// Duration in nanoseconds
using Duration = std::int64_t;

/**
 * @brief Get current timestamp in nanoseconds since epoch
 */
[[nodiscard]] inline Timestamp now_ns() noexcept {
    using Clock = std::chrono::system_clock;
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now().time_since_epoch()
        ).count()
    );
}

/**
 * @brief Monotonic timestamp in nanoseconds, for measuring elapsed time
 */
[[nodiscard]] inline Timestamp steady_ns() noexcept {
    using Clock = std::chrono::steady_clock;
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now().time_since_epoch()
        ).count()
    );
}

/**
 * @brief Calculate elapsed time in nanoseconds since a steady_ns() start
 */
[[nodiscard]] inline Duration elapsed_ns(Timestamp start) noexcept {
    return static_cast<Duration>(steady_ns() - start);
}

/**
 * @brief Convert nanoseconds to milliseconds
 */
[[nodiscard]] constexpr double ns_to_ms(Duration ns) noexcept {
    return static_cast<double>(ns) / 1'000'000.0;
}

} // namespace cpe
