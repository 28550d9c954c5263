#pragma once
/**
 * @file concepts.hpp
 * @brief C++20 Concepts for type constraints in the payments engine
 */

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace cpe {

struct RawEvent;

// ============================================================================
// Container Concepts
// ============================================================================

/**
 * @brief Capacity usable with index masking
 */
template<std::size_t N>
concept PowerOfTwo = N > 0 && (N & (N - 1)) == 0;

/**
 * @brief Types that can be stored in the shard queues
 */
template<typename T>
concept QueueElement =
    std::is_default_constructible_v<T> &&
    std::is_copy_assignable_v<T> &&
    std::is_move_assignable_v<T>;

// ============================================================================
// Collaborator Concepts
// ============================================================================

/**
 * @brief Input collaborator: yields raw records one at a time
 *
 * next() fills the record and returns true, or returns false at end of
 * input. It may throw EngineError for malformed input.
 */
template<typename S>
concept RawEventSource = requires(S source, RawEvent& out) {
    { source.next(out) } -> std::convertible_to<bool>;
};

} // namespace cpe
