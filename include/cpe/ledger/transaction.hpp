#pragma once
/**
 * @file transaction.hpp
 * @brief Ledger record of an accepted deposit or withdrawal
 *
 * The amount and kind never change once recorded; only the dispute state
 * moves, and only along the transitions below:
 *
 *   Active --dispute--> Disputed --resolve--> Active
 *                          |
 *                          +--chargeback--> ChargedBack (terminal)
 */

#include <cpe/common/types.hpp>
#include <cpe/common/amount.hpp>

#include <cstdint>

namespace cpe {

enum class RecordKind : std::uint8_t {
    Deposit = 0,
    Withdrawal = 1
};

[[nodiscard]] constexpr const char* to_string(RecordKind k) noexcept {
    return k == RecordKind::Deposit ? "Deposit" : "Withdrawal";
}

enum class DisputeState : std::uint8_t {
    Active = 0,
    Disputed = 1,
    ChargedBack = 2
};

[[nodiscard]] constexpr const char* to_string(DisputeState s) noexcept {
    switch (s) {
        case DisputeState::Active:      return "Active";
        case DisputeState::Disputed:    return "Disputed";
        case DisputeState::ChargedBack: return "ChargedBack";
    }
    return "Unknown";
}

/**
 * @brief One accepted deposit or withdrawal, owned by a single account
 */
class TranRecord {
private:
    TxId tx_id_{};
    ClientId client_id_{};
    Amount amount_{};
    RecordKind kind_{RecordKind::Deposit};
    DisputeState state_{DisputeState::Active};

public:
    TranRecord(TxId tx, ClientId client, RecordKind kind, Amount amount) noexcept
        : tx_id_(tx)
        , client_id_(client)
        , amount_(amount)
        , kind_(kind) {
    }

    [[nodiscard]] TxId tx_id() const noexcept { return tx_id_; }
    [[nodiscard]] ClientId client_id() const noexcept { return client_id_; }
    [[nodiscard]] Amount amount() const noexcept { return amount_; }
    [[nodiscard]] RecordKind kind() const noexcept { return kind_; }
    [[nodiscard]] DisputeState state() const noexcept { return state_; }

    [[nodiscard]] bool is_disputed() const noexcept {
        return state_ == DisputeState::Disputed;
    }

    // State transitions. Each returns false and leaves the record untouched
    // when the transition is not legal from the current state.

    [[nodiscard]] bool open_dispute() noexcept {
        if (state_ != DisputeState::Active) return false;
        state_ = DisputeState::Disputed;
        return true;
    }

    [[nodiscard]] bool resolve() noexcept {
        if (state_ != DisputeState::Disputed) return false;
        state_ = DisputeState::Active;
        return true;
    }

    [[nodiscard]] bool charge_back() noexcept {
        if (state_ != DisputeState::Disputed) return false;
        state_ = DisputeState::ChargedBack;
        return true;
    }

    bool operator==(const TranRecord&) const noexcept = default;
};

} // namespace cpe
