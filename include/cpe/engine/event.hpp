#pragma once
/**
 * @file event.hpp
 * @brief Raw input records and validated payment events
 *
 * RawEvent is what the input collaborator produces: untrusted text fields.
 * Event is what the EventValidator hands to the dispatcher: typed and
 * checked, small enough to copy through the shard queues.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/amount.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace cpe {

/**
 * @brief One input record before validation
 *
 * An absent optional means the column is missing or the field is empty.
 */
struct RawEvent {
    std::optional<std::string> type;
    std::optional<std::string> client;
    std::optional<std::string> tx;
    std::optional<std::string> amount;
    std::size_t extra_fields{0};  // Fields beyond the recognized schema
    std::size_t line{0};          // Source line, 0 when unknown
};

/**
 * @brief Validated payment event submitted to the shard queues
 */
struct Event {
    EventKind kind{EventKind::Deposit};
    ClientId client{};
    TxId tx{};
    std::optional<Amount> amount;

    // Factory methods for clarity

    [[nodiscard]] static Event deposit(ClientId client, TxId tx, Amount amount) noexcept {
        return Event{
            .kind = EventKind::Deposit,
            .client = client,
            .tx = tx,
            .amount = amount
        };
    }

    [[nodiscard]] static Event withdrawal(ClientId client, TxId tx, Amount amount) noexcept {
        return Event{
            .kind = EventKind::Withdrawal,
            .client = client,
            .tx = tx,
            .amount = amount
        };
    }

    [[nodiscard]] static Event dispute(ClientId client, TxId tx) noexcept {
        return Event{.kind = EventKind::Dispute, .client = client, .tx = tx, .amount = std::nullopt};
    }

    [[nodiscard]] static Event resolve(ClientId client, TxId tx) noexcept {
        return Event{.kind = EventKind::Resolve, .client = client, .tx = tx, .amount = std::nullopt};
    }

    [[nodiscard]] static Event chargeback(ClientId client, TxId tx) noexcept {
        return Event{.kind = EventKind::Chargeback, .client = client, .tx = tx, .amount = std::nullopt};
    }

    bool operator==(const Event&) const noexcept = default;
};

} // namespace cpe
