#pragma once
/**
 * @file payments_engine.hpp
 * @brief One complete run: validate, dispatch, apply, export
 *
 * The run is all-or-nothing. RunResult either carries the full balance
 * snapshot or the fatal error that aborted the run, never both.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/concepts.hpp>
#include <cpe/common/error.hpp>
#include <cpe/common/time.hpp>
#include <cpe/engine/config.hpp>
#include <cpe/engine/dispatcher.hpp>
#include <cpe/engine/event.hpp>
#include <cpe/engine/snapshot.hpp>
#include <cpe/logging/async_logger.hpp>
#include <cpe/metrics/stats.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cpe {

enum class RunStatus : std::uint8_t {
    Completed = 0,
    Aborted = 1
};

[[nodiscard]] constexpr const char* to_string(RunStatus s) noexcept {
    return s == RunStatus::Completed ? "Completed" : "Aborted";
}

/**
 * @brief Outcome of a run
 */
struct RunResult {
    RunStatus status{RunStatus::Aborted};
    std::optional<ErrorCode> error;
    std::string message;
    std::vector<BalanceRow> balances;  // Empty unless Completed
    StatsSnapshot stats;

    [[nodiscard]] bool success() const noexcept {
        return status == RunStatus::Completed;
    }
};

/**
 * @brief Runs a batch of events through a fresh set of shards
 *
 * Each call to run() starts from empty account state.
 */
class PaymentsEngine {
public:
    using EngineDispatcher = Dispatcher<constants::DEFAULT_QUEUE_CAPACITY>;

private:
    EngineConfig config_;
    AsyncLogger* logger_;

public:
    explicit PaymentsEngine(EngineConfig config = {}, AsyncLogger* logger = nullptr)
        : config_(std::move(config))
        , logger_(logger) {
    }

    /**
     * @brief Pull raw records from an input collaborator until exhausted
     *
     * Errors raised by the source itself (for example a bad header) abort
     * the run the same way validation errors do.
     */
    template<RawEventSource Source>
    [[nodiscard]] RunResult run(Source& source) {
        return execute([&source](EngineDispatcher& dispatcher) {
            RawEvent raw;
            while (source.next(raw)) {
                dispatcher.dispatch(raw);
            }
        });
    }

    /**
     * @brief Run already-typed events
     */
    [[nodiscard]] RunResult run(std::span<const Event> events) {
        return execute([events](EngineDispatcher& dispatcher) {
            for (const Event& event : events) {
                dispatcher.dispatch(event);
            }
        });
    }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    template<typename Feed>
    RunResult execute(Feed&& feed) {
        const Timestamp start = steady_ns();
        RunResult result;

        EngineDispatcher dispatcher(config_, logger_);
        try {
            dispatcher.start();
            feed(dispatcher);
            dispatcher.finish();

            result.balances = SnapshotExporter::collect(dispatcher.shards(), config_.snapshot_order);
            result.status = RunStatus::Completed;
        } catch (const EngineError& e) {
            result.status = RunStatus::Aborted;
            result.error = e.code();
            result.message = e.what();
            result.balances.clear();
        }

        result.stats = dispatcher.stats();
        result.stats.elapsed_ns = elapsed_ns(start);

        if (logger_) {
            if (result.success()) {
                logger_->info("run completed: clients=%zu", result.balances.size());
            } else {
                logger_->error("run aborted (%s): %s",
                               to_string(*result.error), result.message.c_str());
            }
            result.stats.log(*logger_);
        }
        return result;
    }
};

} // namespace cpe
