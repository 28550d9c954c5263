#pragma once
/**
 * @file csv_reader.hpp
 * @brief Input collaborator: splits `type,client,tx,amount` CSV into raw records
 *
 * CSV Format:
 *   type,client,tx,amount
 *   deposit,1,1,1.0
 *   withdrawal,1,2,0.5
 *   dispute,1,1,
 *   resolve,1,1
 *
 * Columns may appear in any order. Fields are trimmed and may be wrapped
 * in one pair of double quotes; an empty field is treated as absent.
 * Quoted commas and escaped quotes are not supported.
 */

#include <cpe/engine/event.hpp>

#include <cstdint>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cpe {

class CsvEventReader {
public:
    enum class Column : std::uint8_t {
        Type = 0,
        Client = 1,
        Tx = 2,
        Amount = 3
    };

private:
    std::istream& in_;
    std::vector<Column> columns_;
    std::size_t line_{0};
    bool header_read_{false};

public:
    /**
     * @param in Stream positioned at the header row
     */
    explicit CsvEventReader(std::istream& in) noexcept
        : in_(in) {
    }

    /**
     * @brief Read the next data row
     * @param out Filled with the row's fields on success
     * @return false at end of input
     * @throws InvalidInputError (InvalidHeader) for a missing or bad header
     */
    bool next(RawEvent& out);

    /**
     * @brief Column layout taken from the header (reads it if needed)
     * @throws InvalidInputError (InvalidHeader)
     */
    const std::vector<Column>& columns();

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    void read_header();
    bool read_line(std::string& line);
};

} // namespace cpe
