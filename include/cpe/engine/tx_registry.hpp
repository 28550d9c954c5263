#pragma once
/**
 * @file tx_registry.hpp
 * @brief Run-wide set of deposit and withdrawal transaction ids
 */

#include <cpe/common/types.hpp>
#include <cpe/engine/event.hpp>

#include <cstddef>
#include <unordered_set>

namespace cpe {

/**
 * @brief Rejects a deposit or withdrawal whose tx id was already used
 *
 * Uniqueness is global across clients. Every deposit/withdrawal consumes
 * its id, including ones a shard later ignores. Dispute, resolve and
 * chargeback reference ids and never consume them.
 *
 * Not thread-safe: owned by the single dispatching thread.
 */
class TxRegistry {
private:
    std::unordered_set<TxId> seen_;

public:
    /**
     * @brief Record the event's tx id if it carries one
     * @throws InvalidInputError (DuplicateTransaction)
     */
    void record(const Event& event);

    [[nodiscard]] bool contains(TxId tx) const noexcept { return seen_.contains(tx); }
    [[nodiscard]] std::size_t size() const noexcept { return seen_.size(); }
};

} // namespace cpe
