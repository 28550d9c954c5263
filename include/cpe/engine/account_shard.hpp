#pragma once
/**
 * @file account_shard.hpp
 * @brief A partition of client accounts applied by a single worker
 */

#include <cpe/common/types.hpp>
#include <cpe/engine/event.hpp>
#include <cpe/ledger/account.hpp>
#include <cpe/metrics/stats.hpp>

#include <cstddef>
#include <unordered_map>

namespace cpe {

class AsyncLogger;

/**
 * @brief Owns every ClientAccount whose id maps to this shard
 *
 * Thread Safety:
 * - apply() must only ever be called from the shard's own worker
 * - stats() may be read from any thread
 * - accounts may be read from other threads only after the worker has
 *   been joined
 */
class AccountShard {
private:
    std::size_t index_;
    std::unordered_map<ClientId, ClientAccount> accounts_;
    ShardStats stats_;
    AsyncLogger* logger_;

public:
    explicit AccountShard(std::size_t index = 0, AsyncLogger* logger = nullptr)
        : index_(index)
        , logger_(logger) {
    }

    // Non-copyable, non-movable (owns atomics)
    AccountShard(const AccountShard&) = delete;
    AccountShard& operator=(const AccountShard&) = delete;

    /**
     * @brief Apply one event to the owning client's account
     *
     * Deposits and withdrawals create the account on first sight.
     * Dispute, resolve and chargeback for an unseen client return
     * UnknownClient without creating anything.
     *
     * @return Applied, or the reason the event was ignored
     * @throws InvalidInputError, OverflowError (fatal for the run)
     */
    ApplyResult apply(const Event& event);

    /**
     * @brief Get existing account
     * @return Pointer to account, or nullptr if not found
     */
    [[nodiscard]] const ClientAccount* find(ClientId client) const noexcept;

    [[nodiscard]] const std::unordered_map<ClientId, ClientAccount>& accounts() const noexcept {
        return accounts_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

    [[nodiscard]] ShardStats& stats() noexcept { return stats_; }
    [[nodiscard]] const ShardStats& stats() const noexcept { return stats_; }

private:
    ClientAccount& get_or_create(ClientId client);
};

} // namespace cpe
