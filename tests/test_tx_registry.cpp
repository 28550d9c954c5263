/**
 * @file test_tx_registry.cpp
 * @brief Unit tests for run-wide transaction id uniqueness
 */

#include <gtest/gtest.h>

#include <cpe/common/error.hpp>
#include <cpe/engine/tx_registry.hpp>

using namespace cpe;

TEST(TxRegistryTest, RecordsDepositsAndWithdrawals) {
    TxRegistry registry;

    registry.record(Event::deposit(ClientId{1}, TxId{1}, Amount::parse("1")));
    registry.record(Event::withdrawal(ClientId{1}, TxId{2}, Amount::parse("1")));

    EXPECT_TRUE(registry.contains(TxId{1}));
    EXPECT_TRUE(registry.contains(TxId{2}));
    EXPECT_FALSE(registry.contains(TxId{3}));
    EXPECT_EQ(registry.size(), 2);
}

TEST(TxRegistryTest, DuplicateAcrossClientsThrows) {
    TxRegistry registry;
    registry.record(Event::deposit(ClientId{1}, TxId{5}, Amount::parse("1")));

    try {
        registry.record(Event::withdrawal(ClientId{2}, TxId{5}, Amount::parse("1")));
        FAIL() << "expected duplicate to throw";
    } catch (const InvalidInputError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateTransaction);
    }
    EXPECT_EQ(registry.size(), 1);
}

TEST(TxRegistryTest, ReferencingEventsNeitherConsumeNorCollide) {
    TxRegistry registry;

    registry.record(Event::dispute(ClientId{1}, TxId{9}));
    EXPECT_FALSE(registry.contains(TxId{9}));

    registry.record(Event::deposit(ClientId{1}, TxId{9}, Amount::parse("1")));
    EXPECT_NO_THROW(registry.record(Event::dispute(ClientId{1}, TxId{9})));
    EXPECT_NO_THROW(registry.record(Event::resolve(ClientId{1}, TxId{9})));
    EXPECT_NO_THROW(registry.record(Event::chargeback(ClientId{1}, TxId{9})));
    EXPECT_EQ(registry.size(), 1);
}
