#pragma once
/**
 * @file snapshot.hpp
 * @brief Final balance rows collected across all shards
 */

#include <cpe/common/types.hpp>
#include <cpe/common/amount.hpp>
#include <cpe/engine/account_shard.hpp>
#include <cpe/engine/config.hpp>
#include <cpe/ledger/account.hpp>

#include <span>
#include <vector>

namespace cpe {

/**
 * @brief One client's final state as handed to the output collaborator
 */
struct BalanceRow {
    ClientId client{};
    Amount available{};
    Amount held{};
    Amount total{};
    bool locked{false};

    bool operator==(const BalanceRow&) const noexcept = default;
};

/**
 * @brief Walks finished shards into balance rows
 *
 * Must only be called once every shard worker has been joined.
 */
class SnapshotExporter {
public:
    /**
     * @brief Build the row for a single account
     * @throws OverflowError if available + held overflows
     */
    [[nodiscard]] static BalanceRow row(const ClientAccount& account);

    /**
     * @brief Collect a row for every account in every shard
     * @throws OverflowError
     */
    [[nodiscard]] static std::vector<BalanceRow> collect(
        std::span<const AccountShard* const> shards,
        SnapshotOrder order = SnapshotOrder::Unordered
    );
};

} // namespace cpe
