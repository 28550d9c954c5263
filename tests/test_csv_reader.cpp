/**
 * @file test_csv_reader.cpp
 * @brief Unit tests for the CSV input reader and the balance writer
 */

#include <gtest/gtest.h>

#include <cpe/common/error.hpp>
#include <cpe/io/balance_writer.hpp>
#include <cpe/io/csv_reader.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace cpe;

namespace {

std::vector<RawEvent> read_all(const std::string& text) {
    std::istringstream in(text);
    CsvEventReader reader(in);
    std::vector<RawEvent> out;
    RawEvent raw;
    while (reader.next(raw)) {
        out.push_back(raw);
    }
    return out;
}

ErrorCode header_error(const std::string& text) {
    try {
        (void)read_all(text);
    } catch (const EngineError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected header to be rejected";
    return ErrorCode::InvalidAmount;
}

} // namespace

// ============================================================================
// CsvEventReader Tests
// ============================================================================

TEST(CsvEventReaderTest, ReadsRows) {
    auto rows = read_all(
        "type,client,tx,amount\n"
        "deposit,1,1,1.0\n"
        "dispute,1,1,\n");

    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0].type, "deposit");
    EXPECT_EQ(rows[0].client, "1");
    EXPECT_EQ(rows[0].tx, "1");
    EXPECT_EQ(rows[0].amount, "1.0");
    EXPECT_EQ(rows[0].line, 2);

    EXPECT_EQ(rows[1].type, "dispute");
    EXPECT_FALSE(rows[1].amount.has_value());
    EXPECT_EQ(rows[1].line, 3);
}

TEST(CsvEventReaderTest, TrimsWhitespace) {
    auto rows = read_all(
        " type , client ,tx, amount\r\n"
        "  withdrawal ,\t2 , 5 ,  0.5 \r\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].type, "withdrawal");
    EXPECT_EQ(rows[0].client, "2");
    EXPECT_EQ(rows[0].tx, "5");
    EXPECT_EQ(rows[0].amount, "0.5");
}

TEST(CsvEventReaderTest, ColumnsInAnyOrder) {
    auto rows = read_all(
        "amount,tx,type,client\n"
        "3.25,10,deposit,4\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].type, "deposit");
    EXPECT_EQ(rows[0].client, "4");
    EXPECT_EQ(rows[0].tx, "10");
    EXPECT_EQ(rows[0].amount, "3.25");
}

TEST(CsvEventReaderTest, QuotedFieldsUnwrapped) {
    auto rows = read_all(
        "\"type\",\"client\",\"tx\",\"amount\"\n"
        "\"deposit\",1, \"7\" ,\"1.0\"\n"
        "dispute,1,7,\"\"\n");

    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0].type, "deposit");
    EXPECT_EQ(rows[0].client, "1");
    EXPECT_EQ(rows[0].tx, "7");
    EXPECT_EQ(rows[0].amount, "1.0");
    EXPECT_FALSE(rows[1].amount.has_value());
}

TEST(CsvEventReaderTest, LoneQuoteKeptAsIs) {
    auto rows = read_all(
        "type,client,tx,amount\n"
        "\"deposit,1,1,1\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].type, "\"deposit");
}

TEST(CsvEventReaderTest, ShortRowLeavesTrailingColumnsAbsent) {
    auto rows = read_all(
        "type,client,tx,amount\n"
        "resolve,1,1\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].tx, "1");
    EXPECT_FALSE(rows[0].amount.has_value());
    EXPECT_EQ(rows[0].extra_fields, 0);
}

TEST(CsvEventReaderTest, ExtraFieldsCounted) {
    auto rows = read_all(
        "type,client,tx,amount\n"
        "deposit,1,1,1.0,oops,more\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].extra_fields, 2);
}

TEST(CsvEventReaderTest, BlankLinesSkipped) {
    auto rows = read_all(
        "\n"
        "type,client,tx,amount\n"
        "\n"
        "   \n"
        "deposit,1,1,1\n"
        "\n");

    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].line, 5);
}

TEST(CsvEventReaderTest, HeaderOnlyIsEmptyInput) {
    EXPECT_TRUE(read_all("type,client,tx,amount\n").empty());
}

TEST(CsvEventReaderTest, ByteOrderMarkTolerated) {
    auto rows = read_all("\xEF\xBB\xBFtype,client,tx,amount\ndeposit,1,1,1\n");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].type, "deposit");
}

TEST(CsvEventReaderTest, InvalidHeaders) {
    EXPECT_EQ(header_error(""), ErrorCode::InvalidHeader);
    EXPECT_EQ(header_error("type,client,tx,value\n"), ErrorCode::InvalidHeader);
    EXPECT_EQ(header_error("type,client,client,amount\n"), ErrorCode::InvalidHeader);
    EXPECT_EQ(header_error("deposit,1,1,1.0\n"), ErrorCode::InvalidHeader);
}

TEST(CsvEventReaderTest, ColumnsExposed) {
    std::istringstream in("tx,type\n");
    CsvEventReader reader(in);
    const auto& columns = reader.columns();
    ASSERT_EQ(columns.size(), 2);
    EXPECT_EQ(columns[0], CsvEventReader::Column::Tx);
    EXPECT_EQ(columns[1], CsvEventReader::Column::Type);
}

// ============================================================================
// Balance writer Tests
// ============================================================================

TEST(BalanceWriterTest, WritesHeaderAndRows) {
    std::vector<BalanceRow> rows{
        BalanceRow{ClientId{1}, Amount::parse("1.5"), Amount::zero(), Amount::parse("1.5"), false},
        BalanceRow{ClientId{2}, Amount::parse("2"), Amount::parse("0.0001"), Amount::parse("2.0001"), true},
    };

    std::ostringstream os;
    write_balances(os, rows);

    EXPECT_EQ(os.str(),
              "client,available,held,total,locked\n"
              "1,1.5000,0.0000,1.5000,false\n"
              "2,2.0000,0.0001,2.0001,true\n");
}

TEST(BalanceWriterTest, EmptySnapshotWritesHeaderOnly) {
    std::ostringstream os;
    write_balances(os, {});
    EXPECT_EQ(os.str(), "client,available,held,total,locked\n");
}

TEST(BalanceWriterTest, NegativeAvailable) {
    BalanceRow row{ClientId{3}, Amount::from_ticks(-40'000), Amount::parse("5"), Amount::parse("1"), false};
    EXPECT_EQ(format_balance_row(row), "3,-4.0000,5.0000,1.0000,false");
}
