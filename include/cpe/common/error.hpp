#pragma once
/**
 * @file error.hpp
 * @brief Fatal error taxonomy for a payments run
 *
 * Any exception deriving from EngineError aborts the whole run and
 * suppresses balance output. Ignorable partner errors are not exceptions;
 * they are reported as ApplyResult values.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpe {

enum class ErrorCode : std::uint8_t {
    InvalidAmount = 0,
    AmountPrecision = 1,
    NegativeAmount = 2,
    ZeroAmount = 3,
    MissingAmount = 4,
    UnexpectedAmount = 5,
    MissingField = 6,
    ExtraField = 7,
    UnknownEventType = 8,
    InvalidIdentifier = 9,
    DuplicateTransaction = 10,
    InvalidHeader = 11,
    Overflow = 12
};

[[nodiscard]] constexpr const char* to_string(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::InvalidAmount:        return "InvalidAmount";
        case ErrorCode::AmountPrecision:      return "AmountPrecision";
        case ErrorCode::NegativeAmount:       return "NegativeAmount";
        case ErrorCode::ZeroAmount:           return "ZeroAmount";
        case ErrorCode::MissingAmount:        return "MissingAmount";
        case ErrorCode::UnexpectedAmount:     return "UnexpectedAmount";
        case ErrorCode::MissingField:         return "MissingField";
        case ErrorCode::ExtraField:           return "ExtraField";
        case ErrorCode::UnknownEventType:     return "UnknownEventType";
        case ErrorCode::InvalidIdentifier:    return "InvalidIdentifier";
        case ErrorCode::DuplicateTransaction: return "DuplicateTransaction";
        case ErrorCode::InvalidHeader:        return "InvalidHeader";
        case ErrorCode::Overflow:             return "Overflow";
    }
    return "Unknown";
}

/**
 * @brief Base class of every condition that is fatal to a run
 */
class EngineError : public std::runtime_error {
private:
    ErrorCode code_;

public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
};

/**
 * @brief Malformed input: shape, amount rules, duplicate transaction ids
 */
class InvalidInputError : public EngineError {
public:
    InvalidInputError(ErrorCode code, const std::string& message)
        : EngineError(code, message) {
    }
};

/**
 * @brief Amount arithmetic left the representable range
 */
class OverflowError : public EngineError {
public:
    explicit OverflowError(const std::string& message)
        : EngineError(ErrorCode::Overflow, message) {
    }
};

} // namespace cpe
