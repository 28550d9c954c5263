/**
 * @file amount.cpp
 * @brief Checked fixed-point arithmetic and decimal text conversion
 */

#include <cpe/common/amount.hpp>
#include <cpe/common/macros.hpp>

#include <cstddef>

namespace cpe {

namespace {

constexpr std::int64_t INT64_MAX_VALUE = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t INT64_MIN_VALUE = std::numeric_limits<std::int64_t>::min();

[[nodiscard]] constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

[[nodiscard]] bool add_overflows(std::int64_t a, std::int64_t b) noexcept {
    return (b > 0 && a > INT64_MAX_VALUE - b) || (b < 0 && a < INT64_MIN_VALUE - b);
}

[[nodiscard]] bool sub_overflows(std::int64_t a, std::int64_t b) noexcept {
    return (b < 0 && a > INT64_MAX_VALUE + b) || (b > 0 && a < INT64_MIN_VALUE + b);
}

[[noreturn]] void throw_invalid(ErrorCode code, std::string_view text, const char* why) {
    throw InvalidInputError(code, std::string(why) + ": '" + std::string(text) + "'");
}

} // namespace

Amount Amount::from_units(std::int64_t units) {
    if (units > INT64_MAX_VALUE / constants::AMOUNT_SCALE ||
        units < INT64_MIN_VALUE / constants::AMOUNT_SCALE) {
        throw OverflowError("amount out of range: " + std::to_string(units));
    }
    return Amount{units * constants::AMOUNT_SCALE};
}

Amount Amount::parse(std::string_view text) {
    const std::string_view s = trim(text);
    if (s.empty()) {
        throw_invalid(ErrorCode::InvalidAmount, text, "empty amount");
    }

    std::size_t pos = 0;
    bool negative = false;
    if (s[pos] == '-') {
        negative = true;
        ++pos;
    } else if (s[pos] == '+') {
        throw_invalid(ErrorCode::InvalidAmount, text, "explicit sign not allowed");
    }

    if (pos < s.size() && s[pos] == '.') {
        throw_invalid(ErrorCode::InvalidAmount, text, "leading decimal point not allowed");
    }

    const std::size_t int_begin = pos;
    while (pos < s.size() && is_digit(s[pos])) ++pos;
    const std::string_view int_digits = s.substr(int_begin, pos - int_begin);
    if (int_digits.empty()) {
        throw_invalid(ErrorCode::InvalidAmount, text, "not a number");
    }

    std::string_view frac_digits;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const std::size_t frac_begin = pos;
        while (pos < s.size() && is_digit(s[pos])) ++pos;
        frac_digits = s.substr(frac_begin, pos - frac_begin);
    }

    if (pos != s.size()) {
        throw_invalid(ErrorCode::InvalidAmount, text, "not a number");
    }
    if (frac_digits.size() > static_cast<std::size_t>(constants::AMOUNT_SCALE_DIGITS)) {
        throw_invalid(ErrorCode::AmountPrecision, text, "too many decimal places");
    }
    if (negative) {
        throw_invalid(ErrorCode::NegativeAmount, text, "negative amount");
    }

    std::int64_t ticks = 0;
    auto push_digit = [&](char c) {
        const std::int64_t d = c - '0';
        if (ticks > (INT64_MAX_VALUE - d) / 10) {
            throw OverflowError("amount out of range: '" + std::string(s) + "'");
        }
        ticks = ticks * 10 + d;
    };

    for (char c : int_digits) push_digit(c);
    for (char c : frac_digits) push_digit(c);
    for (std::size_t i = frac_digits.size();
         i < static_cast<std::size_t>(constants::AMOUNT_SCALE_DIGITS); ++i) {
        push_digit('0');
    }

    return Amount{ticks};
}

Amount Amount::operator+(Amount rhs) const {
    if CPE_UNLIKELY(add_overflows(ticks_, rhs.ticks_)) {
        throw OverflowError("amount overflow: " + to_string() + " + " + rhs.to_string());
    }
    return Amount{ticks_ + rhs.ticks_};
}

Amount Amount::operator-(Amount rhs) const {
    if CPE_UNLIKELY(sub_overflows(ticks_, rhs.ticks_)) {
        throw OverflowError("amount overflow: " + to_string() + " - " + rhs.to_string());
    }
    return Amount{ticks_ - rhs.ticks_};
}

Amount& Amount::operator+=(Amount rhs) {
    *this = *this + rhs;
    return *this;
}

Amount& Amount::operator-=(Amount rhs) {
    *this = *this - rhs;
    return *this;
}

std::string Amount::to_string() const {
    // Magnitude in unsigned space so INT64_MIN renders correctly
    const bool negative = ticks_ < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(ticks_ + 1)) + 1
        : static_cast<std::uint64_t>(ticks_);

    const auto scale = static_cast<std::uint64_t>(constants::AMOUNT_SCALE);
    std::string frac = std::to_string(magnitude % scale);
    frac.insert(0, static_cast<std::size_t>(constants::AMOUNT_SCALE_DIGITS) - frac.size(), '0');

    std::string out;
    if (negative) out.push_back('-');
    out += std::to_string(magnitude / scale);
    out.push_back('.');
    out += frac;
    return out;
}

std::ostream& operator<<(std::ostream& os, const Amount& amount) {
    return os << amount.to_string();
}

} // namespace cpe
