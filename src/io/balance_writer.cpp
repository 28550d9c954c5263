/**
 * @file balance_writer.cpp
 * @brief CSV rendering of the final balance snapshot
 */

#include <cpe/io/balance_writer.hpp>

#include <ostream>

namespace cpe {

std::string format_balance_row(const BalanceRow& row) {
    std::string line = std::to_string(row.client.get());
    line += ',';
    line += row.available.to_string();
    line += ',';
    line += row.held.to_string();
    line += ',';
    line += row.total.to_string();
    line += ',';
    line += row.locked ? "true" : "false";
    return line;
}

void write_balances(std::ostream& os, std::span<const BalanceRow> rows) {
    os << BALANCE_HEADER << '\n';
    for (const BalanceRow& row : rows) {
        os << format_balance_row(row) << '\n';
    }
    os.flush();
}

} // namespace cpe
