/**
 * @file test_account.cpp
 * @brief Unit tests for the client account state machine and transaction records
 */

#include <gtest/gtest.h>

#include <cpe/common/amount.hpp>
#include <cpe/common/error.hpp>
#include <cpe/ledger/account.hpp>
#include <cpe/ledger/transaction.hpp>

using namespace cpe;

namespace {

Amount amt(const char* text) {
    return Amount::parse(text);
}

} // namespace

// ============================================================================
// TranRecord Tests
// ============================================================================

TEST(TranRecordTest, DisputeLifecycle) {
    TranRecord rec(TxId{1}, ClientId{1}, RecordKind::Deposit, amt("5"));
    EXPECT_EQ(rec.state(), DisputeState::Active);

    EXPECT_FALSE(rec.resolve());
    EXPECT_FALSE(rec.charge_back());

    EXPECT_TRUE(rec.open_dispute());
    EXPECT_TRUE(rec.is_disputed());
    EXPECT_FALSE(rec.open_dispute());

    EXPECT_TRUE(rec.resolve());
    EXPECT_EQ(rec.state(), DisputeState::Active);

    // Re-dispute after resolve is allowed
    EXPECT_TRUE(rec.open_dispute());
    EXPECT_TRUE(rec.charge_back());
    EXPECT_EQ(rec.state(), DisputeState::ChargedBack);

    // Terminal
    EXPECT_FALSE(rec.open_dispute());
    EXPECT_FALSE(rec.resolve());
    EXPECT_FALSE(rec.charge_back());
}

// ============================================================================
// ClientAccount Tests
// ============================================================================

class ClientAccountTest : public ::testing::Test {
protected:
    ClientAccount account{ClientId{1}};

    void expect_balances(const char* available, const char* held) {
        EXPECT_EQ(account.available(), amt(available));
        EXPECT_EQ(account.held(), amt(held));
        EXPECT_EQ(account.total(), account.available() + account.held());
    }
};

TEST_F(ClientAccountTest, StartsEmpty) {
    EXPECT_EQ(account.client_id(), ClientId{1});
    expect_balances("0", "0");
    EXPECT_FALSE(account.locked());
    EXPECT_EQ(account.ledger_size(), 0);
}

TEST_F(ClientAccountTest, DepositsSumExactly) {
    EXPECT_EQ(account.deposit(TxId{1}, amt("1.0001")), ApplyResult::Applied);
    EXPECT_EQ(account.deposit(TxId{2}, amt("2.0002")), ApplyResult::Applied);
    expect_balances("3.0003", "0");
    EXPECT_EQ(account.ledger_size(), 2);
}

TEST_F(ClientAccountTest, WithdrawalReducesAvailable) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("10")), ApplyResult::Applied);
    EXPECT_EQ(account.withdraw(TxId{2}, amt("4.5")), ApplyResult::Applied);
    expect_balances("5.5", "0");

    const TranRecord* rec = account.find(TxId{2});
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->tx_id(), TxId{2});
    EXPECT_EQ(rec->client_id(), ClientId{1});
    EXPECT_EQ(rec->kind(), RecordKind::Withdrawal);
    EXPECT_EQ(rec->amount(), amt("4.5"));
}

TEST_F(ClientAccountTest, WithdrawEntireBalance) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("2")), ApplyResult::Applied);
    EXPECT_EQ(account.withdraw(TxId{2}, amt("2")), ApplyResult::Applied);
    expect_balances("0", "0");
}

TEST_F(ClientAccountTest, InsufficientFundsLeavesNoRecord) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("1")), ApplyResult::Applied);
    EXPECT_EQ(account.withdraw(TxId{2}, amt("1.0001")), ApplyResult::InsufficientFunds);
    expect_balances("1", "0");
    EXPECT_EQ(account.find(TxId{2}), nullptr);
    EXPECT_EQ(account.ledger_size(), 1);

    // So a later dispute of it is an unknown transaction
    EXPECT_EQ(account.dispute(TxId{2}), ApplyResult::UnknownTransaction);
}

TEST_F(ClientAccountTest, DuplicateTxIsFatal) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("1")), ApplyResult::Applied);
    try {
        (void)account.deposit(TxId{1}, amt("2"));
        FAIL() << "expected duplicate to throw";
    } catch (const InvalidInputError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateTransaction);
    }
    EXPECT_THROW((void)account.withdraw(TxId{1}, amt("0.5")), InvalidInputError);
    expect_balances("1", "0");
}

TEST_F(ClientAccountTest, NonPositiveAmountIsFatal) {
    try {
        (void)account.deposit(TxId{1}, Amount::zero());
        FAIL() << "expected zero amount to throw";
    } catch (const InvalidInputError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ZeroAmount);
    }
    try {
        (void)account.withdraw(TxId{2}, Amount::from_ticks(-1));
        FAIL() << "expected negative amount to throw";
    } catch (const InvalidInputError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NegativeAmount);
    }
    EXPECT_EQ(account.ledger_size(), 0);
}

TEST_F(ClientAccountTest, DisputeThenResolveRestoresState) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("3")), ApplyResult::Applied);
    ASSERT_EQ(account.deposit(TxId{2}, amt("1.25")), ApplyResult::Applied);

    EXPECT_EQ(account.dispute(TxId{1}), ApplyResult::Applied);
    expect_balances("1.25", "3");
    EXPECT_TRUE(account.find(TxId{1})->is_disputed());

    EXPECT_EQ(account.resolve(TxId{1}), ApplyResult::Applied);
    expect_balances("4.25", "0");
    EXPECT_EQ(account.find(TxId{1})->state(), DisputeState::Active);
    EXPECT_FALSE(account.locked());
}

TEST_F(ClientAccountTest, DisputeCanDriveAvailableNegative) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("5")), ApplyResult::Applied);
    ASSERT_EQ(account.withdraw(TxId{2}, amt("4")), ApplyResult::Applied);

    EXPECT_EQ(account.dispute(TxId{1}), ApplyResult::Applied);
    EXPECT_EQ(account.available(), Amount::from_ticks(-40'000));
    EXPECT_EQ(account.held(), amt("5"));
    EXPECT_EQ(account.total(), amt("1"));
}

TEST_F(ClientAccountTest, ChargebackLocksAccount) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("2")), ApplyResult::Applied);
    ASSERT_EQ(account.deposit(TxId{2}, amt("3")), ApplyResult::Applied);
    ASSERT_EQ(account.dispute(TxId{1}), ApplyResult::Applied);

    EXPECT_EQ(account.chargeback(TxId{1}), ApplyResult::Applied);
    expect_balances("3", "0");
    EXPECT_TRUE(account.locked());
    EXPECT_EQ(account.find(TxId{1})->state(), DisputeState::ChargedBack);

    // Everything afterwards is ignored
    EXPECT_EQ(account.deposit(TxId{3}, amt("1")), ApplyResult::AccountLocked);
    EXPECT_EQ(account.withdraw(TxId{4}, amt("1")), ApplyResult::AccountLocked);
    EXPECT_EQ(account.dispute(TxId{2}), ApplyResult::AccountLocked);
    EXPECT_EQ(account.resolve(TxId{1}), ApplyResult::AccountLocked);
    EXPECT_EQ(account.chargeback(TxId{1}), ApplyResult::AccountLocked);
    expect_balances("3", "0");
    EXPECT_EQ(account.ledger_size(), 2);
}

TEST_F(ClientAccountTest, LockedCheckPrecedesDuplicateCheck) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("1")), ApplyResult::Applied);
    ASSERT_EQ(account.dispute(TxId{1}), ApplyResult::Applied);
    ASSERT_EQ(account.chargeback(TxId{1}), ApplyResult::Applied);

    EXPECT_EQ(account.deposit(TxId{1}, amt("1")), ApplyResult::AccountLocked);
}

TEST_F(ClientAccountTest, ChargebackOfDisputedWithdrawal) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("10")), ApplyResult::Applied);
    ASSERT_EQ(account.withdraw(TxId{2}, amt("4")), ApplyResult::Applied);
    ASSERT_EQ(account.dispute(TxId{2}), ApplyResult::Applied);
    expect_balances("2", "4");

    EXPECT_EQ(account.chargeback(TxId{2}), ApplyResult::Applied);
    expect_balances("2", "0");
    EXPECT_TRUE(account.locked());
}

TEST_F(ClientAccountTest, PartnerErrorsAreIgnored) {
    ASSERT_EQ(account.deposit(TxId{1}, amt("1")), ApplyResult::Applied);

    EXPECT_EQ(account.dispute(TxId{99}), ApplyResult::UnknownTransaction);
    EXPECT_EQ(account.resolve(TxId{99}), ApplyResult::UnknownTransaction);
    EXPECT_EQ(account.chargeback(TxId{99}), ApplyResult::UnknownTransaction);

    EXPECT_EQ(account.resolve(TxId{1}), ApplyResult::NotDisputed);
    EXPECT_EQ(account.chargeback(TxId{1}), ApplyResult::NotDisputed);

    ASSERT_EQ(account.dispute(TxId{1}), ApplyResult::Applied);
    EXPECT_EQ(account.dispute(TxId{1}), ApplyResult::AlreadyDisputed);
    expect_balances("0", "1");
}

TEST_F(ClientAccountTest, OverflowLeavesAccountUnchanged) {
    ASSERT_EQ(account.deposit(TxId{1}, Amount::max()), ApplyResult::Applied);
    EXPECT_THROW((void)account.deposit(TxId{2}, Amount::from_ticks(1)), OverflowError);
    EXPECT_EQ(account.available(), Amount::max());
    EXPECT_EQ(account.find(TxId{2}), nullptr);
}
