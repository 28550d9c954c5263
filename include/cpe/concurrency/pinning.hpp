#pragma once
/**
 * @file pinning.hpp
 * @brief Thread affinity for shard workers
 *
 * Uses pthread_setaffinity_np on Linux, SetThreadAffinityMask on Windows,
 * reports NotSupported elsewhere.
 */

#include <cpe/common/macros.hpp>

#include <cerrno>
#include <cstdint>
#include <thread>

#if defined(__linux__)
    #include <pthread.h>
    #include <sched.h>
#elif defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>
#endif

namespace cpe {

enum class PinResult {
    Success,
    NotSupported,
    InvalidCore,
    PermissionDenied,
    Failed
};

[[nodiscard]] constexpr const char* to_string(PinResult result) noexcept {
    switch (result) {
        case PinResult::Success:          return "Success";
        case PinResult::NotSupported:     return "NotSupported";
        case PinResult::InvalidCore:      return "InvalidCore";
        case PinResult::PermissionDenied: return "PermissionDenied";
        case PinResult::Failed:           return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Number of hardware threads, at least 1
 */
[[nodiscard]] inline std::uint32_t get_num_cores() noexcept {
    const std::uint32_t n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

/**
 * @brief Pin the calling thread to a CPU core
 *
 * Shard workers call this with (shard index % cores) so that shards spread
 * across cores when there are more shards than cores.
 *
 * @param core_id CPU core ID (0-based)
 */
[[nodiscard]] inline PinResult pin_thread_to_core(std::uint32_t core_id) noexcept {
#if defined(__linux__)
    if (core_id >= get_num_cores()) {
        return PinResult::InvalidCore;
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);

    int result = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);

    if (result == 0) {
        return PinResult::Success;
    } else if (result == EPERM) {
        return PinResult::PermissionDenied;
    } else if (result == EINVAL) {
        return PinResult::InvalidCore;
    }
    return PinResult::Failed;

#elif defined(_WIN32)
    if (core_id >= get_num_cores()) {
        return PinResult::InvalidCore;
    }

    DWORD_PTR mask = 1ULL << core_id;
    if (SetThreadAffinityMask(GetCurrentThread(), mask) != 0) {
        return PinResult::Success;
    }
    return GetLastError() == ERROR_ACCESS_DENIED ? PinResult::PermissionDenied : PinResult::Failed;

#else
    (void)core_id;
    return PinResult::NotSupported;
#endif
}

} // namespace cpe
