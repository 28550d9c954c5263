/**
 * @file bench_engine_throughput.cpp
 * @brief Throughput benchmarks for shard application and the full dispatcher
 */

#include <benchmark/benchmark.h>

#include <cpe/common/types.hpp>
#include <cpe/engine/account_shard.hpp>
#include <cpe/engine/dispatcher.hpp>
#include <cpe/engine/payments_engine.hpp>
#include <cpe/io/csv_reader.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace cpe;

constexpr std::size_t QUEUE_CAPACITY = 65536;
constexpr std::uint16_t NUM_CLIENTS = 128;

namespace {

// Mostly deposits, with disputes and resolves of earlier deposits mixed in
std::vector<Event> make_events(std::size_t count) {
    std::vector<Event> events;
    events.reserve(count);

    std::uint32_t tx = 1;
    for (std::size_t i = 0; i < count; ++i) {
        ClientId client{static_cast<std::uint16_t>(i % NUM_CLIENTS)};
        if (i % 10 == 8 && i >= NUM_CLIENTS) {
            events.push_back(Event::dispute(client, TxId{tx - NUM_CLIENTS}));
        } else if (i % 10 == 9 && i >= NUM_CLIENTS) {
            events.push_back(Event::resolve(client, TxId{tx - NUM_CLIENTS}));
        } else {
            events.push_back(Event::deposit(client, TxId{tx}, Amount::from_ticks(10'000)));
        }
        ++tx;
    }
    return events;
}

} // namespace

// ============================================================================
// Single shard, no threads
// ============================================================================

static void BM_ShardApply(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        AccountShard shard;
        for (const Event& e : events) {
            benchmark::DoNotOptimize(shard.apply(e));
        }
        benchmark::ClobberMemory();
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(events.size()));
}
BENCHMARK(BM_ShardApply)->Arg(10'000)->Arg(100'000);

// ============================================================================
// Dispatcher, varying shard count
// ============================================================================

static void BM_DispatcherThroughput(benchmark::State& state) {
    const auto events = make_events(200'000);

    EngineConfig config;
    config.shard_count = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        Dispatcher<QUEUE_CAPACITY> dispatcher(config);
        dispatcher.start();
        for (const Event& e : events) {
            dispatcher.dispatch(e);
        }
        dispatcher.finish();
        benchmark::DoNotOptimize(dispatcher.events_dispatched());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(events.size()));
}
BENCHMARK(BM_DispatcherThroughput)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

// ============================================================================
// CSV in, snapshot out
// ============================================================================

static void BM_EndToEndCsv(benchmark::State& state) {
    const auto rows = static_cast<std::uint32_t>(state.range(0));

    std::string csv = "type,client,tx,amount\n";
    for (std::uint32_t i = 1; i <= rows; ++i) {
        csv += "deposit," + std::to_string(i % NUM_CLIENTS) + "," + std::to_string(i) + ",1\n";
    }

    EngineConfig config;
    PaymentsEngine engine(config);

    for (auto _ : state) {
        std::istringstream in(csv);
        CsvEventReader reader(in);
        RunResult result = engine.run(reader);
        if (!result.success()) {
            state.SkipWithError(result.message.c_str());
            break;
        }
        benchmark::DoNotOptimize(result.balances.data());
    }

    state.SetItemsProcessed(state.iterations() * rows);
}
BENCHMARK(BM_EndToEndCsv)->Arg(100'000)->UseRealTime();

BENCHMARK_MAIN();
