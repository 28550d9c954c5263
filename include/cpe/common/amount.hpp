#pragma once
/**
 * @file amount.hpp
 * @brief Fixed-point monetary amount with four fractional digits
 *
 * Stored as a signed count of ticks (0.0001). All arithmetic is exact and
 * checked: leaving the int64 range throws OverflowError.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/error.hpp>

#include <compare>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace cpe {

class Amount {
private:
    std::int64_t ticks_{0};

    constexpr explicit Amount(std::int64_t ticks) noexcept : ticks_(ticks) {}

public:
    constexpr Amount() noexcept = default;

    /**
     * @brief Build from a raw tick count (1 tick = 0.0001)
     */
    [[nodiscard]] static constexpr Amount from_ticks(std::int64_t ticks) noexcept {
        return Amount{ticks};
    }

    /**
     * @brief Build from a whole number of units
     * @throws OverflowError if units * 10^4 does not fit
     */
    [[nodiscard]] static Amount from_units(std::int64_t units);

    /**
     * @brief Parse non-negative decimal text with at most four fractional digits
     *
     * Surrounding whitespace is ignored. Accepted: "12", "12.", "12.3456".
     * Rejected: ".5", "-1", "+1", "1.23456", "1.2.3", "1e3", "".
     *
     * @throws InvalidInputError (InvalidAmount, AmountPrecision, NegativeAmount)
     * @throws OverflowError if the value exceeds the tick range
     */
    [[nodiscard]] static Amount parse(std::string_view text);

    [[nodiscard]] static constexpr Amount zero() noexcept { return Amount{0}; }

    [[nodiscard]] static constexpr Amount max() noexcept {
        return Amount{std::numeric_limits<std::int64_t>::max()};
    }

    [[nodiscard]] constexpr std::int64_t ticks() const noexcept { return ticks_; }
    [[nodiscard]] constexpr bool is_zero() const noexcept { return ticks_ == 0; }
    [[nodiscard]] constexpr bool is_negative() const noexcept { return ticks_ < 0; }
    [[nodiscard]] constexpr bool is_positive() const noexcept { return ticks_ > 0; }

    constexpr auto operator<=>(const Amount&) const noexcept = default;
    constexpr bool operator==(const Amount&) const noexcept = default;

    /// @throws OverflowError
    [[nodiscard]] Amount operator+(Amount rhs) const;
    /// @throws OverflowError
    [[nodiscard]] Amount operator-(Amount rhs) const;
    /// @throws OverflowError
    Amount& operator+=(Amount rhs);
    /// @throws OverflowError
    Amount& operator-=(Amount rhs);

    /**
     * @brief Render with exactly four fractional digits, e.g. "3.0003"
     */
    [[nodiscard]] std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const Amount& amount);

} // namespace cpe
