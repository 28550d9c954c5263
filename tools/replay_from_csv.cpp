/**
 * @file replay_from_csv.cpp
 * @brief Replay a payments CSV through a single shard, event by event
 *
 * CSV Format:
 *   type,client,tx,amount
 *   deposit,1,1,1.0         (credit client 1)
 *   withdrawal,1,2,0.5      (debit client 1)
 *   dispute,1,1,            (hold the funds of tx 1)
 *   chargeback,1,1,         (reverse tx 1 and lock client 1)
 *
 * Prints the outcome of every event, then statistics and the final balances.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/error.hpp>
#include <cpe/common/time.hpp>
#include <cpe/engine/account_shard.hpp>
#include <cpe/engine/snapshot.hpp>
#include <cpe/engine/tx_registry.hpp>
#include <cpe/engine/validator.hpp>
#include <cpe/io/balance_writer.hpp>
#include <cpe/io/csv_reader.hpp>

#include <fstream>
#include <iostream>
#include <string>

using namespace cpe;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <csv_file>\n";
        std::cout << "\nCSV Format:\n";
        std::cout << "  type,client,tx,amount\n";
        std::cout << "  deposit,1,1,1.0      (Deposit)\n";
        std::cout << "  withdrawal,1,2,0.5   (Withdrawal)\n";
        std::cout << "  dispute,1,1,         (Dispute)\n";
        std::cout << "  resolve,1,1,         (Resolve)\n";
        std::cout << "  chargeback,1,1,      (Chargeback)\n";
        return 1;
    }

    std::string filename = argv[1];
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file: " << filename << "\n";
        return 1;
    }
    std::cout << "Reading events from: " << filename << "\n\n";

    CsvEventReader reader(file);
    AccountShard shard;
    TxRegistry tx_registry;

    Timestamp start = steady_ns();

    try {
        RawEvent raw;
        while (reader.next(raw)) {
            Event event = EventValidator::validate(raw);
            tx_registry.record(event);

            std::cout << "line " << raw.line << ": " << to_string(event.kind)
                      << " client=" << event.client.get()
                      << " tx=" << event.tx.get();
            if (event.amount) {
                std::cout << " amount=" << *event.amount;
            }
            std::cout << "\n";

            ApplyResult result = shard.apply(event);
            std::cout << "  -> " << to_string(result) << "\n";
        }
    } catch (const EngineError& e) {
        std::cout << "line " << reader.line() << ": FATAL " << to_string(e.code())
                  << ": " << e.what() << "\n";
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    StatsSnapshot stats;
    stats.accumulate(shard.stats());
    stats.elapsed_ns = elapsed_ns(start);

    std::cout << "\n";
    stats.print(std::cout);

    const AccountShard* shards[] = {&shard};
    auto rows = SnapshotExporter::collect(shards, SnapshotOrder::ByClientId);

    std::cout << "\n=== Final Balances ===\n";
    write_balances(std::cout, rows);

    return 0;
}
