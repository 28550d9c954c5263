#pragma once
/**
 * @file macros.hpp
 * @brief Common macros for branch hints, alignment and debugging
 */

#include <cassert>
#include <cstddef>

namespace cpe {

// ============================================================================
// Cache Line Size
// ============================================================================

/// Standard cache line size (64 bytes on most modern CPUs)
inline constexpr std::size_t CACHE_LINE_SIZE = 64;

// ============================================================================
// Branch Prediction Hints
// ============================================================================

/// Hint that condition is likely to be true (C++20)
/// Usage: if CPE_LIKELY(condition) { ... }
#define CPE_LIKELY(x)   (x) [[likely]]
/// Hint that condition is unlikely to be true (C++20)
/// Usage: if CPE_UNLIKELY(condition) { ... }
#define CPE_UNLIKELY(x) (x) [[unlikely]]

// ============================================================================
// Debug Assertions
// ============================================================================

#ifndef NDEBUG
    /// Debug-only assertion
    #define CPE_ASSERT(cond) assert(cond)
    /// Debug-only assertion with message
    #define CPE_ASSERT_MSG(cond, msg) assert((cond) && (msg))
#else
    #define CPE_ASSERT(cond) ((void)0)
    #define CPE_ASSERT_MSG(cond, msg) ((void)0)
#endif

// ============================================================================
// Alignment Helpers
// ============================================================================

/// Align struct/variable to cache line boundary
#define CPE_CACHE_ALIGNED alignas(cpe::CACHE_LINE_SIZE)

} // namespace cpe
