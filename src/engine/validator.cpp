/**
 * @file validator.cpp
 * @brief Event shape and amount validation
 */

#include <cpe/engine/validator.hpp>
#include <cpe/common/amount.hpp>

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>

namespace cpe {

namespace {

[[nodiscard]] std::string where(const RawEvent& raw) {
    return raw.line == 0 ? std::string{} : " (line " + std::to_string(raw.line) + ")";
}

[[nodiscard]] std::string describe(const Event& event) {
    return std::string(to_string(event.kind)) + " client " + std::to_string(event.client.get()) +
           " tx " + std::to_string(event.tx.get());
}

} // namespace

template<typename Id>
Id EventValidator::parse_id(std::string_view text, const char* field) {
    using Value = typename Id::value_type;

    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (text.empty() || ec != std::errc{} || ptr != last ||
        value > static_cast<std::uint64_t>(std::numeric_limits<Value>::max())) {
        throw InvalidInputError(ErrorCode::InvalidIdentifier,
            std::string("invalid ") + field + " id '" + std::string(text) + "'");
    }
    return Id{static_cast<Value>(value)};
}

template ClientId EventValidator::parse_id<ClientId>(std::string_view, const char*);
template TxId EventValidator::parse_id<TxId>(std::string_view, const char*);

Event EventValidator::validate(const RawEvent& raw) {
    if (raw.extra_fields > 0) {
        throw InvalidInputError(ErrorCode::ExtraField,
            "record has " + std::to_string(raw.extra_fields) + " unexpected field(s)" + where(raw));
    }
    if (!raw.type) {
        throw InvalidInputError(ErrorCode::MissingField, "missing type" + where(raw));
    }
    if (!raw.client) {
        throw InvalidInputError(ErrorCode::MissingField, "missing client" + where(raw));
    }
    if (!raw.tx) {
        throw InvalidInputError(ErrorCode::MissingField, "missing tx" + where(raw));
    }

    const auto kind = parse_event_kind(*raw.type);
    if (!kind) {
        throw InvalidInputError(ErrorCode::UnknownEventType,
            "unknown transaction type '" + *raw.type + "'" + where(raw));
    }

    Event event;
    event.kind = *kind;
    try {
        event.client = parse_id<ClientId>(*raw.client, "client");
        event.tx = parse_id<TxId>(*raw.tx, "tx");

        if (carries_amount(*kind)) {
            if (!raw.amount) {
                throw InvalidInputError(ErrorCode::MissingAmount,
                    std::string("amount required for ") + to_string(*kind));
            }
            event.amount = Amount::parse(*raw.amount);
        } else if (raw.amount) {
            throw InvalidInputError(ErrorCode::UnexpectedAmount,
                std::string("amount not allowed for ") + to_string(*kind));
        }

        check(event);
    } catch (const InvalidInputError& e) {
        if (raw.line == 0) throw;
        throw InvalidInputError(e.code(), e.what() + where(raw));
    }
    return event;
}

void EventValidator::check(const Event& event) {
    if (carries_amount(event.kind)) {
        if (!event.amount) {
            throw InvalidInputError(ErrorCode::MissingAmount,
                "amount required for " + describe(event));
        }
        if (event.amount->is_negative()) {
            throw InvalidInputError(ErrorCode::NegativeAmount,
                "negative amount " + event.amount->to_string() + " for " + describe(event));
        }
        if (event.amount->is_zero()) {
            throw InvalidInputError(ErrorCode::ZeroAmount,
                "zero amount for " + describe(event));
        }
    } else if (event.amount) {
        throw InvalidInputError(ErrorCode::UnexpectedAmount,
            "amount not allowed for " + describe(event));
    }
}

} // namespace cpe
