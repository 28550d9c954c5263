#pragma once
/**
 * @file dispatcher.hpp
 * @brief Routes validated events to shard workers and fails the run fast
 *
 * Owns one AccountShard, one SPSC queue and one worker thread per shard.
 * The calling thread is the single producer for every queue.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/error.hpp>
#include <cpe/common/macros.hpp>
#include <cpe/concurrency/pinning.hpp>
#include <cpe/concurrency/spsc_semaphore_queue.hpp>
#include <cpe/engine/account_shard.hpp>
#include <cpe/engine/config.hpp>
#include <cpe/engine/event.hpp>
#include <cpe/engine/tx_registry.hpp>
#include <cpe/engine/validator.hpp>
#include <cpe/logging/async_logger.hpp>
#include <cpe/metrics/stats.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace cpe {

/**
 * @brief Partitioned event dispatcher
 *
 * Lifecycle: start() -> dispatch()* -> finish(). After finish() returns
 * normally every event has been applied and shards() may be exported.
 *
 * Fail-fast: the first InvalidInputError or OverflowError, raised either
 * while validating on the calling thread or by any shard worker, aborts the
 * run. Workers stop consuming, and every later dispatch() or finish()
 * rethrows that first error.
 *
 * Ordering: events for one client always land in the same queue and are
 * applied in dispatch order. Nothing is guaranteed across clients.
 *
 * @tparam QueueCapacity Capacity of each shard queue (must be power of 2)
 */
template<std::size_t QueueCapacity>
class Dispatcher {
public:
    using Queue = SpscSemaphoreQueue<Event, QueueCapacity>;

private:
    struct ShardSlot {
        AccountShard shard;
        Queue queue;
        std::jthread worker;

        ShardSlot(std::size_t index, AsyncLogger* logger)
            : shard(index, logger) {
        }
    };

    EngineConfig config_;
    AsyncLogger* logger_;
    std::vector<std::unique_ptr<ShardSlot>> slots_;

    // Touched only by the calling thread
    TxRegistry tx_registry_;

    std::atomic<bool> aborted_{false};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    bool started_{false};
    bool finished_{false};
    std::uint64_t dispatched_{0};

public:
    /**
     * @brief Construct dispatcher
     * @param config Run configuration (shard_count is clamped to >= 1)
     * @param logger Optional async logger
     */
    explicit Dispatcher(EngineConfig config = {}, AsyncLogger* logger = nullptr)
        : config_(std::move(config))
        , logger_(logger) {

        if (config_.shard_count == 0) {
            config_.shard_count = 1;
        }
        slots_.reserve(config_.shard_count);
        for (std::size_t i = 0; i < config_.shard_count; ++i) {
            slots_.push_back(std::make_unique<ShardSlot>(i, logger_));
        }
    }

    ~Dispatcher() {
        stop_workers();
    }

    // Non-copyable, non-movable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Spawn one worker per shard
     */
    void start() {
        if (started_) {
            return;
        }
        started_ = true;

        for (auto& slot : slots_) {
            ShardSlot* s = slot.get();
            s->worker = std::jthread([this, s](std::stop_token stop_token) {
                run_worker(*s, stop_token);
            });
        }

        if (logger_) {
            logger_->info("dispatcher started: shards=%zu queue_capacity=%zu pinning=%s",
                          slots_.size(), QueueCapacity, config_.pin_threads ? "on" : "off");
        }
    }

    /**
     * @brief Validate a raw record and route it
     * @throws InvalidInputError, OverflowError
     */
    void dispatch(const RawEvent& raw) {
        throw_if_aborted();
        Event event;
        try {
            event = EventValidator::validate(raw);
        } catch (const EngineError&) {
            fail(std::current_exception());
            throw;
        }
        dispatch(event);
    }

    /**
     * @brief Route an already-typed event to its shard
     *
     * Blocks while the target queue is full, re-checking for abort every
     * poll interval.
     *
     * @throws InvalidInputError on duplicate tx id or malformed event
     * @throws the first shard failure, if any shard has failed
     */
    void dispatch(const Event& event) {
        throw_if_aborted();
        CPE_ASSERT_MSG(started_, "dispatch() before start()");

        try {
            EventValidator::check(event);
            tx_registry_.record(event);
        } catch (const EngineError&) {
            fail(std::current_exception());
            throw;
        }

        Queue& queue = slots_[shard_index(event.client)]->queue;
        while (!queue.try_push_for(event, config_.poll_interval)) {
            throw_if_aborted();
        }
        ++dispatched_;
    }

    /**
     * @brief Signal end of input, wait for every shard to drain
     * @throws the first fatal error of the run, if any
     */
    void finish() {
        stop_workers();
        throw_if_aborted();
        finished_ = true;

        if (logger_) {
            logger_->info("dispatcher finished: events=%llu accounts=%zu",
                          static_cast<unsigned long long>(dispatched_), account_count());
        }
    }

    /**
     * @brief Shard selection, a pure function of the client id
     */
    [[nodiscard]] std::size_t shard_index(ClientId client) const noexcept {
        return static_cast<std::size_t>(client.get()) % slots_.size();
    }

    [[nodiscard]] std::size_t shard_count() const noexcept { return slots_.size(); }

    [[nodiscard]] const AccountShard& shard(std::size_t index) const noexcept {
        return slots_[index]->shard;
    }

    /**
     * @brief All shards, for the snapshot exporter (valid after finish())
     */
    [[nodiscard]] std::vector<const AccountShard*> shards() const {
        std::vector<const AccountShard*> out;
        out.reserve(slots_.size());
        for (const auto& slot : slots_) {
            out.push_back(&slot->shard);
        }
        return out;
    }

    [[nodiscard]] bool aborted() const noexcept {
        return aborted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    [[nodiscard]] std::uint64_t events_dispatched() const noexcept { return dispatched_; }

    [[nodiscard]] StatsSnapshot stats() const noexcept {
        StatsSnapshot snap;
        for (const auto& slot : slots_) {
            snap.accumulate(slot->shard.stats());
        }
        return snap;
    }

private:
    void run_worker(ShardSlot& slot, std::stop_token stop_token) {
        if (config_.pin_threads) {
            const auto core = static_cast<std::uint32_t>(slot.shard.index() % get_num_cores());
            PinResult pin = pin_thread_to_core(core);
            if (pin != PinResult::Success && logger_) {
                logger_->warn("shard %zu: pinning to core %u failed: %s",
                              slot.shard.index(), static_cast<unsigned>(core), to_string(pin));
            }
        }

        Event event;

        while (!stop_token.stop_requested() && !aborted()) {
            // Bounded wait so stop and abort are noticed promptly
            if (!slot.queue.try_pop_for(event, config_.poll_interval)) {
                continue;
            }
            if (!apply(slot, event)) {
                return;
            }
        }

        // Drain what the producer enqueued before requesting stop
        while (!aborted() && !slot.queue.empty_approx()) {
            if (slot.queue.try_pop_for(event, config_.poll_interval) && !apply(slot, event)) {
                return;
            }
        }
    }

    /**
     * @return false if the event raised a fatal error
     */
    bool apply(ShardSlot& slot, const Event& event) noexcept {
        try {
            slot.shard.apply(event);
            return true;
        } catch (...) {
            // Recorded and rethrown on the dispatching thread
            fail(std::current_exception());
            return false;
        }
    }

    void fail(std::exception_ptr error) noexcept {
        {
            std::lock_guard lock(error_mutex_);
            if (first_error_) {
                return;
            }
            first_error_ = error;
            aborted_.store(true, std::memory_order_release);
        }

        if (logger_) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                logger_->error("run aborted: %s", e.what());
            } catch (...) {
                logger_->error("run aborted: unknown error");
            }
        }
    }

    void throw_if_aborted() {
        if CPE_UNLIKELY(aborted()) {
            std::exception_ptr error;
            {
                std::lock_guard lock(error_mutex_);
                error = first_error_;
            }
            std::rethrow_exception(error);
        }
    }

    void stop_workers() noexcept {
        for (auto& slot : slots_) {
            if (slot->worker.joinable()) {
                slot->worker.request_stop();
            }
        }
        for (auto& slot : slots_) {
            if (slot->worker.joinable()) {
                slot->worker.join();
            }
        }
    }

    [[nodiscard]] std::size_t account_count() const noexcept {
        std::size_t n = 0;
        for (const auto& slot : slots_) {
            n += slot->shard.size();
        }
        return n;
    }
};

} // namespace cpe
