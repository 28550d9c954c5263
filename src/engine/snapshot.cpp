/**
 * @file snapshot.cpp
 * @brief Snapshot export
 */

#include <cpe/engine/snapshot.hpp>

#include <algorithm>

namespace cpe {

BalanceRow SnapshotExporter::row(const ClientAccount& account) {
    return BalanceRow{
        .client = account.client_id(),
        .available = account.available(),
        .held = account.held(),
        .total = account.total(),
        .locked = account.locked()
    };
}

std::vector<BalanceRow> SnapshotExporter::collect(
    std::span<const AccountShard* const> shards,
    SnapshotOrder order
) {
    std::size_t count = 0;
    for (const AccountShard* shard : shards) {
        count += shard->size();
    }

    std::vector<BalanceRow> rows;
    rows.reserve(count);

    for (const AccountShard* shard : shards) {
        for (const auto& [client, account] : shard->accounts()) {
            rows.push_back(row(account));
        }
    }

    if (order == SnapshotOrder::ByClientId) {
        std::sort(rows.begin(), rows.end(), [](const BalanceRow& a, const BalanceRow& b) {
            return a.client < b.client;
        });
    }
    return rows;
}

} // namespace cpe
