#pragma once
/**
 * @file types.hpp
 * @brief Core type definitions for the Concurrent Payments Engine
 *
 * Defines ClientId and TxId with strong typing so a client identifier can
 * never be passed where a transaction identifier is expected.
 */

// Prevent Windows min/max macros from conflicting with std::numeric_limits
#ifdef _MSC_VER
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <cstddef>
#include <cstdint>
#include <limits>
#include <compare>
#include <optional>
#include <string_view>

namespace cpe {

// ============================================================================
// Strong Type Wrapper Template
// ============================================================================

/**
 * @brief Strong type wrapper to prevent accidental mixing of similar types
 * @tparam T Underlying type
 * @tparam Tag Phantom type for differentiation
 */
template<typename T, typename Tag>
struct StrongType {
    using value_type = T;

    T value{};

    constexpr StrongType() noexcept = default;
    constexpr explicit StrongType(T v) noexcept : value(v) {}

    [[nodiscard]] constexpr T get() const noexcept { return value; }
    [[nodiscard]] constexpr explicit operator T() const noexcept { return value; }

    constexpr auto operator<=>(const StrongType&) const noexcept = default;
    constexpr bool operator==(const StrongType&) const noexcept = default;
};

// ============================================================================
// Type Tags
// ============================================================================

struct ClientIdTag {};
struct TxIdTag {};

// ============================================================================
// Core Types
// ============================================================================

/// Client identifier, also the shard selection key
using ClientId = StrongType<std::uint16_t, ClientIdTag>;

/// Transaction identifier, unique across a run for deposits and withdrawals
using TxId = StrongType<std::uint32_t, TxIdTag>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// Number of distinct client identifiers
inline constexpr std::size_t CLIENT_ID_SPACE =
    static_cast<std::size_t>(std::numeric_limits<ClientId::value_type>::max()) + 1;

/// Default shard queue capacity (events)
inline constexpr std::size_t DEFAULT_QUEUE_CAPACITY = 65536;

/// Fractional digits carried by every Amount
inline constexpr int AMOUNT_SCALE_DIGITS = 4;

/// Ticks per whole unit (10^AMOUNT_SCALE_DIGITS)
inline constexpr std::int64_t AMOUNT_SCALE = 10'000;

} // namespace constants

// ============================================================================
// Event Kind Enumeration
// ============================================================================

enum class EventKind : std::uint8_t {
    Deposit = 0,
    Withdrawal = 1,
    Dispute = 2,
    Resolve = 3,
    Chargeback = 4
};

[[nodiscard]] constexpr const char* to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::Deposit:    return "deposit";
        case EventKind::Withdrawal: return "withdrawal";
        case EventKind::Dispute:    return "dispute";
        case EventKind::Resolve:    return "resolve";
        case EventKind::Chargeback: return "chargeback";
    }
    return "unknown";
}

/// True for the kinds that carry an amount and allocate a TxId
[[nodiscard]] constexpr bool carries_amount(EventKind k) noexcept {
    return k == EventKind::Deposit || k == EventKind::Withdrawal;
}

/// Parse the lowercase wire name of an event kind
[[nodiscard]] constexpr std::optional<EventKind> parse_event_kind(std::string_view s) noexcept {
    if (s == "deposit")    return EventKind::Deposit;
    if (s == "withdrawal") return EventKind::Withdrawal;
    if (s == "dispute")    return EventKind::Dispute;
    if (s == "resolve")    return EventKind::Resolve;
    if (s == "chargeback") return EventKind::Chargeback;
    return std::nullopt;
}

// ============================================================================
// Result/Status Types
// ============================================================================

/**
 * @brief Outcome of applying one event to an account
 *
 * Everything except Applied is a partner error that is absorbed silently.
 */
enum class ApplyResult : std::uint8_t {
    Applied = 0,
    AccountLocked = 1,
    InsufficientFunds = 2,
    UnknownTransaction = 3,
    AlreadyDisputed = 4,
    NotDisputed = 5,
    UnknownClient = 6
};

inline constexpr std::size_t APPLY_RESULT_COUNT = 7;

[[nodiscard]] constexpr const char* to_string(ApplyResult r) noexcept {
    switch (r) {
        case ApplyResult::Applied:            return "Applied";
        case ApplyResult::AccountLocked:      return "AccountLocked";
        case ApplyResult::InsufficientFunds:  return "InsufficientFunds";
        case ApplyResult::UnknownTransaction: return "UnknownTransaction";
        case ApplyResult::AlreadyDisputed:    return "AlreadyDisputed";
        case ApplyResult::NotDisputed:        return "NotDisputed";
        case ApplyResult::UnknownClient:      return "UnknownClient";
    }
    return "Unknown";
}

} // namespace cpe

// ============================================================================
// Hash Specializations for std::unordered_map
// ============================================================================

namespace std {

template<typename T, typename Tag>
struct hash<cpe::StrongType<T, Tag>> {
    std::size_t operator()(const cpe::StrongType<T, Tag>& st) const noexcept {
        return std::hash<T>{}(st.get());
    }
};

} // namespace std
