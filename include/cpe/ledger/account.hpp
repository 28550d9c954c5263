#pragma once
/**
 * @file account.hpp
 * @brief Per-client balance state and private transaction ledger
 *
 * Not thread-safe. A ClientAccount is mutated only by the shard that owns
 * its client id, so no synchronization is needed here.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/amount.hpp>
#include <cpe/ledger/transaction.hpp>

#include <cstddef>
#include <unordered_map>

namespace cpe {

/**
 * @brief Balances of one client: available, held, locked and the ledger
 *
 * Invariants after every call: held >= 0, total() == available + held.
 * Available may go negative only through a dispute of funds that were
 * already withdrawn.
 *
 * Fatal conditions (duplicate tx id, non-positive amount, overflow) throw
 * and leave the account unchanged. Partner errors return an ApplyResult
 * other than Applied and also leave the account unchanged.
 */
class ClientAccount {
private:
    ClientId client_id_;
    Amount available_{};
    Amount held_{};
    bool locked_{false};
    std::unordered_map<TxId, TranRecord> ledger_;

public:
    explicit ClientAccount(ClientId client_id) noexcept
        : client_id_(client_id) {
    }

    /**
     * @brief Credit available funds and record the deposit
     * @throws InvalidInputError on duplicate tx id or non-positive amount
     * @throws OverflowError if available would overflow
     */
    ApplyResult deposit(TxId tx, Amount amount);

    /**
     * @brief Debit available funds and record the withdrawal
     *
     * Returns InsufficientFunds without recording anything when
     * available < amount.
     *
     * @throws InvalidInputError on duplicate tx id or non-positive amount
     */
    ApplyResult withdraw(TxId tx, Amount amount);

    /**
     * @brief Move a recorded amount from available to held
     * @throws OverflowError
     */
    ApplyResult dispute(TxId tx);

    /**
     * @brief Release a disputed amount from held back to available
     * @throws OverflowError
     */
    ApplyResult resolve(TxId tx);

    /**
     * @brief Remove a disputed amount from held and lock the account
     * @throws OverflowError
     */
    ApplyResult chargeback(TxId tx);

    [[nodiscard]] ClientId client_id() const noexcept { return client_id_; }
    [[nodiscard]] Amount available() const noexcept { return available_; }
    [[nodiscard]] Amount held() const noexcept { return held_; }
    [[nodiscard]] bool locked() const noexcept { return locked_; }

    /**
     * @brief available + held, computed on demand
     * @throws OverflowError
     */
    [[nodiscard]] Amount total() const { return available_ + held_; }

    /**
     * @brief Look up a ledger record
     * @return Pointer to record, or nullptr if this account never accepted tx
     */
    [[nodiscard]] const TranRecord* find(TxId tx) const noexcept;

    [[nodiscard]] std::size_t ledger_size() const noexcept { return ledger_.size(); }

private:
    void check_amount(TxId tx, Amount amount, RecordKind kind) const;
    void check_unique(TxId tx) const;
    [[nodiscard]] TranRecord* find_mutable(TxId tx) noexcept;
};

} // namespace cpe
