#pragma once
/**
 * @file spsc_semaphore_queue.hpp
 * @brief Bounded single-producer single-consumer queue feeding one shard
 *
 * The dispatcher is the only producer of every shard queue and each shard
 * worker is the only consumer of its own queue, so per-queue FIFO order is
 * exactly input order for that shard's clients.
 */

#include <cpe/common/concepts.hpp>
#include <cpe/common/macros.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <semaphore>
#include <utility>

namespace cpe {

/**
 * @brief Bounded SPSC queue using counting semaphores for coordination
 *
 * @tparam T Element type
 * @tparam Capacity Queue capacity (must be power of 2)
 *
 * Semaphore Protocol:
 * - free_slots: counts available slots (starts at Capacity)
 * - filled_slots: counts items ready to consume (starts at 0)
 *
 * Producer: free_slots.acquire() -> write -> filled_slots.release()
 * Consumer: filled_slots.acquire() -> read -> free_slots.release()
 *
 * Waits are bounded in the try_*_for variants so both sides can poll a
 * stop or abort flag between attempts.
 */
template<QueueElement T, std::size_t Capacity>
    requires PowerOfTwo<Capacity>
class SpscSemaphoreQueue {
private:
    static constexpr std::size_t MASK = Capacity - 1;

    // Heap-allocated buffer to avoid stack overflow with large capacities
    std::unique_ptr<T[]> buffer_;

    // Producer index - only written by producer
    struct alignas(CACHE_LINE_SIZE) {
        std::atomic<std::size_t> value{0};
    } head_;

    // Consumer index - only written by consumer
    struct alignas(CACHE_LINE_SIZE) {
        std::atomic<std::size_t> value{0};
    } tail_;

    std::counting_semaphore<Capacity> free_slots_{Capacity};
    std::counting_semaphore<Capacity> filled_slots_{0};

public:
    SpscSemaphoreQueue() : buffer_(new T[Capacity]{}) {}
    ~SpscSemaphoreQueue() = default;

    // Non-copyable, non-movable
    SpscSemaphoreQueue(const SpscSemaphoreQueue&) = delete;
    SpscSemaphoreQueue& operator=(const SpscSemaphoreQueue&) = delete;
    SpscSemaphoreQueue(SpscSemaphoreQueue&&) = delete;
    SpscSemaphoreQueue& operator=(SpscSemaphoreQueue&&) = delete;

    // ========================================================================
    // Producer Interface (call from ONE thread only)
    // ========================================================================

    /**
     * @brief Push element, blocking until a slot is free
     */
    void push(const T& value) noexcept {
        free_slots_.acquire();
        write_slot(value);
    }

    /**
     * @brief Try to push element (non-blocking)
     * @return true if pushed, false if queue was full
     */
    [[nodiscard]] bool try_push(const T& value) noexcept {
        if (!free_slots_.try_acquire()) {
            return false;
        }
        write_slot(value);
        return true;
    }

    /**
     * @brief Try to push, waiting at most timeout for a free slot
     * @return true if pushed, false on timeout
     */
    template<typename Rep, typename Period>
    [[nodiscard]] bool try_push_for(const T& value,
                                    std::chrono::duration<Rep, Period> timeout) noexcept {
        if (!free_slots_.try_acquire_for(timeout)) {
            return false;
        }
        write_slot(value);
        return true;
    }

    // ========================================================================
    // Consumer Interface (call from ONE thread only)
    // ========================================================================

    /**
     * @brief Pop element, blocking until one is available
     */
    void pop(T& out) noexcept {
        filled_slots_.acquire();
        read_slot(out);
    }

    [[nodiscard]] T pop() noexcept {
        T value;
        pop(value);
        return value;
    }

    /**
     * @brief Try to pop element (non-blocking)
     * @return true if popped, false if queue was empty
     */
    [[nodiscard]] bool try_pop(T& out) noexcept {
        if (!filled_slots_.try_acquire()) {
            return false;
        }
        read_slot(out);
        return true;
    }

    /**
     * @brief Try to pop, waiting at most timeout for an element
     * @return true if popped, false on timeout
     */
    template<typename Rep, typename Period>
    [[nodiscard]] bool try_pop_for(T& out,
                                   std::chrono::duration<Rep, Period> timeout) noexcept {
        if (!filled_slots_.try_acquire_for(timeout)) {
            return false;
        }
        read_slot(out);
        return true;
    }

    // ========================================================================
    // Query Interface (any thread, approximate under concurrency)
    // ========================================================================

    [[nodiscard]] std::size_t size_approx() const noexcept {
        std::size_t head = head_.value.load(std::memory_order_acquire);
        std::size_t tail = tail_.value.load(std::memory_order_acquire);
        return head - tail;
    }

    [[nodiscard]] constexpr std::size_t capacity() const noexcept {
        return Capacity;
    }

    [[nodiscard]] bool empty_approx() const noexcept {
        return size_approx() == 0;
    }

private:
    void write_slot(const T& value) noexcept {
        std::size_t head = head_.value.load(std::memory_order_relaxed);
        buffer_[head & MASK] = value;
        head_.value.store(head + 1, std::memory_order_release);
        filled_slots_.release();
    }

    void read_slot(T& out) noexcept {
        std::size_t tail = tail_.value.load(std::memory_order_relaxed);
        out = std::move(buffer_[tail & MASK]);
        tail_.value.store(tail + 1, std::memory_order_release);
        free_slots_.release();
    }
};

} // namespace cpe
