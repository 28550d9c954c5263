/**
 * @file account.cpp
 * @brief Client account state machine
 */

#include <cpe/ledger/account.hpp>
#include <cpe/common/error.hpp>
#include <cpe/common/macros.hpp>

#include <string>

namespace cpe {

void ClientAccount::check_amount(TxId tx, Amount amount, RecordKind kind) const {
    if CPE_UNLIKELY(!amount.is_positive()) {
        throw InvalidInputError(
            amount.is_zero() ? ErrorCode::ZeroAmount : ErrorCode::NegativeAmount,
            std::string("invalid ") + to_string(kind) + " amount " + amount.to_string() +
            " for tx " + std::to_string(tx.get()));
    }
}

void ClientAccount::check_unique(TxId tx) const {
    if CPE_UNLIKELY(ledger_.contains(tx)) {
        throw InvalidInputError(
            ErrorCode::DuplicateTransaction,
            "duplicate transaction " + std::to_string(tx.get()) +
            " for client " + std::to_string(client_id_.get()));
    }
}

ApplyResult ClientAccount::deposit(TxId tx, Amount amount) {
    check_amount(tx, amount, RecordKind::Deposit);
    if (locked_) {
        return ApplyResult::AccountLocked;
    }
    check_unique(tx);

    const Amount new_available = available_ + amount;
    ledger_.try_emplace(tx, tx, client_id_, RecordKind::Deposit, amount);
    available_ = new_available;
    return ApplyResult::Applied;
}

ApplyResult ClientAccount::withdraw(TxId tx, Amount amount) {
    check_amount(tx, amount, RecordKind::Withdrawal);
    if (locked_) {
        return ApplyResult::AccountLocked;
    }
    check_unique(tx);

    if (available_ < amount) {
        return ApplyResult::InsufficientFunds;
    }

    ledger_.try_emplace(tx, tx, client_id_, RecordKind::Withdrawal, amount);
    available_ = available_ - amount;
    return ApplyResult::Applied;
}

ApplyResult ClientAccount::dispute(TxId tx) {
    if (locked_) {
        return ApplyResult::AccountLocked;
    }
    TranRecord* rec = find_mutable(tx);
    if (rec == nullptr) {
        return ApplyResult::UnknownTransaction;
    }
    if (rec->state() != DisputeState::Active) {
        return rec->is_disputed() ? ApplyResult::AlreadyDisputed : ApplyResult::NotDisputed;
    }

    // Compute both sides before committing so an overflow leaves no trace
    const Amount new_available = available_ - rec->amount();
    const Amount new_held = held_ + rec->amount();

    [[maybe_unused]] const bool opened = rec->open_dispute();
    CPE_ASSERT(opened);
    available_ = new_available;
    held_ = new_held;
    return ApplyResult::Applied;
}

ApplyResult ClientAccount::resolve(TxId tx) {
    if (locked_) {
        return ApplyResult::AccountLocked;
    }
    TranRecord* rec = find_mutable(tx);
    if (rec == nullptr) {
        return ApplyResult::UnknownTransaction;
    }
    if (!rec->is_disputed()) {
        return ApplyResult::NotDisputed;
    }

    const Amount new_held = held_ - rec->amount();
    const Amount new_available = available_ + rec->amount();

    [[maybe_unused]] const bool resolved = rec->resolve();
    CPE_ASSERT(resolved);
    held_ = new_held;
    available_ = new_available;
    return ApplyResult::Applied;
}

ApplyResult ClientAccount::chargeback(TxId tx) {
    if (locked_) {
        return ApplyResult::AccountLocked;
    }
    TranRecord* rec = find_mutable(tx);
    if (rec == nullptr) {
        return ApplyResult::UnknownTransaction;
    }
    if (!rec->is_disputed()) {
        return ApplyResult::NotDisputed;
    }

    const Amount new_held = held_ - rec->amount();

    [[maybe_unused]] const bool charged = rec->charge_back();
    CPE_ASSERT(charged);
    held_ = new_held;
    locked_ = true;
    return ApplyResult::Applied;
}

const TranRecord* ClientAccount::find(TxId tx) const noexcept {
    auto it = ledger_.find(tx);
    return it == ledger_.end() ? nullptr : &it->second;
}

TranRecord* ClientAccount::find_mutable(TxId tx) noexcept {
    auto it = ledger_.find(tx);
    return it == ledger_.end() ? nullptr : &it->second;
}

} // namespace cpe
