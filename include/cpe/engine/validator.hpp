#pragma once
/**
 * @file validator.hpp
 * @brief Stateless shape and amount checks applied before any account state
 *
 * Every violation throws InvalidInputError with a distinct ErrorCode; the
 * dispatcher treats all of them as fatal for the run.
 */

#include <cpe/common/types.hpp>
#include <cpe/common/error.hpp>
#include <cpe/engine/event.hpp>

#include <string_view>

namespace cpe {

/**
 * @brief Validates raw records and typed events
 *
 * Rules:
 * - type, client and tx must be present (MissingField)
 * - type must be a known kind (UnknownEventType)
 * - client and tx must be unsigned decimal ids in range (InvalidIdentifier)
 * - deposit/withdrawal need an amount (MissingAmount) that parses
 *   (Amount::parse codes) and is strictly positive (ZeroAmount)
 * - dispute/resolve/chargeback must not carry an amount (UnexpectedAmount)
 * - no fields beyond the schema (ExtraField)
 */
class EventValidator {
public:
    /**
     * @brief Convert an untrusted record into a checked Event
     * @throws InvalidInputError, OverflowError
     */
    [[nodiscard]] static Event validate(const RawEvent& raw);

    /**
     * @brief Re-check an Event that was built without going through validate()
     * @throws InvalidInputError
     */
    static void check(const Event& event);

    /**
     * @brief Parse an unsigned decimal identifier that must fit in T
     * @throws InvalidInputError (InvalidIdentifier)
     */
    template<typename Id>
    [[nodiscard]] static Id parse_id(std::string_view text, const char* field);
};

} // namespace cpe
