/**
 * @file csv_reader.cpp
 * @brief CSV row splitting for the payments input format
 */

#include <cpe/io/csv_reader.hpp>
#include <cpe/common/error.hpp>

#include <algorithm>
#include <string_view>

namespace cpe {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view WS = " \t\r\n";
    const auto first = s.find_first_not_of(WS);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WS);
    return s.substr(first, last - first + 1);
}

// Trimmed field with one pair of surrounding double quotes removed
[[nodiscard]] std::string_view field(std::string_view raw) noexcept {
    std::string_view s = trim(raw);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = trim(s.substr(1, s.size() - 2));
    }
    return s;
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(field(line.substr(start)));
            break;
        }
        fields.push_back(field(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

[[nodiscard]] std::optional<CsvEventReader::Column> parse_column(std::string_view name) noexcept {
    using Column = CsvEventReader::Column;
    if (name == "type")   return Column::Type;
    if (name == "client") return Column::Client;
    if (name == "tx")     return Column::Tx;
    if (name == "amount") return Column::Amount;
    return std::nullopt;
}

} // namespace

bool CsvEventReader::read_line(std::string& line) {
    while (std::getline(in_, line)) {
        ++line_;
        if (!trim(line).empty()) {
            return true;
        }
    }
    return false;
}

void CsvEventReader::read_header() {
    header_read_ = true;

    std::string line;
    if (!read_line(line)) {
        throw InvalidInputError(ErrorCode::InvalidHeader, "missing header row");
    }

    // Tolerate a UTF-8 byte order mark
    std::string_view view = line;
    if (view.starts_with("\xEF\xBB\xBF")) {
        view.remove_prefix(3);
    }

    for (std::string_view name : split(view)) {
        const auto column = parse_column(name);
        if (!column) {
            throw InvalidInputError(ErrorCode::InvalidHeader,
                "invalid header '" + std::string(name) + "'");
        }
        if (std::find(columns_.begin(), columns_.end(), *column) != columns_.end()) {
            throw InvalidInputError(ErrorCode::InvalidHeader,
                "duplicate header '" + std::string(name) + "'");
        }
        columns_.push_back(*column);
    }
}

const std::vector<CsvEventReader::Column>& CsvEventReader::columns() {
    if (!header_read_) {
        read_header();
    }
    return columns_;
}

bool CsvEventReader::next(RawEvent& out) {
    if (!header_read_) {
        read_header();
    }

    std::string line;
    if (!read_line(line)) {
        return false;
    }

    out = RawEvent{};
    out.line = line_;

    const auto fields = split(line);
    const std::size_t n = std::min(fields.size(), columns_.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (fields[i].empty()) {
            continue;
        }
        std::string value(fields[i]);
        switch (columns_[i]) {
            case Column::Type:   out.type = std::move(value); break;
            case Column::Client: out.client = std::move(value); break;
            case Column::Tx:     out.tx = std::move(value); break;
            case Column::Amount: out.amount = std::move(value); break;
        }
    }
    if (fields.size() > columns_.size()) {
        out.extra_fields = fields.size() - columns_.size();
    }
    return true;
}

} // namespace cpe
