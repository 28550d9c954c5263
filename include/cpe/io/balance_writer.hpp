#pragma once
/**
 * @file balance_writer.hpp
 * @brief Output collaborator: renders balance rows as CSV
 *
 * Output Format:
 *   client,available,held,total,locked
 *   1,1.5000,0.0000,1.5000,false
 */

#include <cpe/engine/snapshot.hpp>

#include <iosfwd>
#include <span>
#include <string>

namespace cpe {

inline constexpr const char* BALANCE_HEADER = "client,available,held,total,locked";

/**
 * @brief Render one row without a trailing newline
 */
[[nodiscard]] std::string format_balance_row(const BalanceRow& row);

/**
 * @brief Write the header followed by one line per row
 */
void write_balances(std::ostream& os, std::span<const BalanceRow> rows);

} // namespace cpe
