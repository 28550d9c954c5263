#pragma once
/**
 * @file async_logger.hpp
 * @brief Bounded async logger shared by the dispatcher and shard workers
 *
 * Log messages are formatted into fixed-size buffer entries.
 * A background thread flushes them to file, never blocking the caller
 * for I/O.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/time.hpp>
#include <cpe/common/macros.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace cpe {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

[[nodiscard]] constexpr const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

/// Parse a level name as given on the command line ("debug", "info", ...)
[[nodiscard]] constexpr std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn")  return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return std::nullopt;
}

/**
 * @brief Fixed-size log entry to avoid dynamic allocation
 */
struct LogEntry {
    static constexpr std::size_t MAX_MESSAGE_SIZE = 256;

    Timestamp timestamp{0};
    LogLevel level{LogLevel::Info};
    std::array<char, MAX_MESSAGE_SIZE> message{};
    std::size_t length{0};

    LogEntry() = default;
};

/**
 * @brief Async logger with bounded buffer
 *
 * Design:
 * - Log entries stored in fixed-size ring buffer
 * - Callers are never blocked on I/O - messages dropped if buffer full
 * - Background thread flushes to file periodically
 * - Uses snprintf for formatting (no dynamic allocation)
 * - Messages below the minimum level are discarded before formatting
 *
 * Thread Safety:
 * - log() can be called from any thread (every shard worker logs)
 * - Producers serialize on a short critical section; the flush thread
 *   only touches entries between tail and the published head
 */
class AsyncLogger {
public:
    static constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;

private:
    static constexpr std::size_t BUFFER_MASK = DEFAULT_BUFFER_SIZE - 1;
    static_assert((DEFAULT_BUFFER_SIZE & BUFFER_MASK) == 0, "Buffer size must be power of 2");

    std::array<LogEntry, DEFAULT_BUFFER_SIZE> buffer_{};

    CPE_CACHE_ALIGNED std::atomic<std::size_t> head_{0};  // Write position
    CPE_CACHE_ALIGNED std::atomic<std::size_t> tail_{0};  // Read position

    std::mutex producer_mutex_;
    std::mutex flush_mutex_;
    std::ofstream file_;
    std::jthread flush_thread_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::atomic<std::uint64_t> messages_logged_{0};
    std::atomic<std::uint64_t> messages_dropped_{0};

    std::chrono::milliseconds flush_interval_{10};

public:
    /**
     * @brief Construct async logger
     * @param filename Output file path (truncated)
     * @param min_level Messages below this level are discarded
     * @param flush_interval How often to flush
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit AsyncLogger(
        const std::string& filename,
        LogLevel min_level = LogLevel::Info,
        std::chrono::milliseconds flush_interval = std::chrono::milliseconds{10}
    )
        : min_level_(min_level)
        , flush_interval_(flush_interval) {

        file_.open(filename, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + filename);
        }

        start();
    }

    ~AsyncLogger() {
        stop();
    }

    // Non-copyable, non-movable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * @brief Log a printf-style formatted message
     *
     * Never blocks on I/O - drops if buffer full.
     */
    template<typename... Args>
    void log(LogLevel level, const char* fmt, Args&&... args) noexcept {
        if (level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        std::lock_guard lock(producer_mutex_);

        std::size_t head = head_.load(std::memory_order_relaxed);
        std::size_t tail = tail_.load(std::memory_order_acquire);

        // Check if buffer full (leave one slot empty for disambiguation)
        std::size_t next_head = (head + 1) & BUFFER_MASK;
        if CPE_UNLIKELY(next_head == tail) {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        LogEntry& entry = buffer_[head];
        entry.timestamp = now_ns();
        entry.level = level;

        if constexpr (sizeof...(Args) == 0) {
            entry.length = std::min(std::strlen(fmt), LogEntry::MAX_MESSAGE_SIZE - 1);
            std::memcpy(entry.message.data(), fmt, entry.length);
            entry.message[entry.length] = '\0';
        } else {
            int result = std::snprintf(
                entry.message.data(),
                LogEntry::MAX_MESSAGE_SIZE,
                fmt,
                std::forward<Args>(args)...
            );
            entry.length = (result > 0)
                ? std::min(static_cast<std::size_t>(result), LogEntry::MAX_MESSAGE_SIZE - 1)
                : 0;
        }

        head_.store(next_head, std::memory_order_release);
        messages_logged_.fetch_add(1, std::memory_order_relaxed);
    }

    template<typename... Args>
    void debug(const char* fmt, Args&&... args) noexcept {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const char* fmt, Args&&... args) noexcept {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const char* fmt, Args&&... args) noexcept {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const char* fmt, Args&&... args) noexcept {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Flush pending messages to file
     */
    void flush() {
        std::lock_guard lock(flush_mutex_);

        std::size_t tail = tail_.load(std::memory_order_relaxed);
        std::size_t head = head_.load(std::memory_order_acquire);

        while (tail != head) {
            const LogEntry& entry = buffer_[tail];

            file_ << entry.timestamp << " " << to_string(entry.level) << " "
                  << std::string_view(entry.message.data(), entry.length)
                  << "\n";

            tail = (tail + 1) & BUFFER_MASK;
        }

        tail_.store(tail, std::memory_order_release);
        file_.flush();
    }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level >= min_level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t messages_logged() const noexcept {
        return messages_logged_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t messages_dropped() const noexcept {
        return messages_dropped_.load(std::memory_order_relaxed);
    }

private:
    void start() {
        flush_thread_ = std::jthread([this](std::stop_token stop_token) {
            while (!stop_token.stop_requested()) {
                std::this_thread::sleep_for(flush_interval_);
                flush();
            }
            // Final flush
            flush();
        });
    }

    void stop() {
        if (flush_thread_.joinable()) {
            flush_thread_.request_stop();
            flush_thread_.join();
        }
    }
};

} // namespace cpe
