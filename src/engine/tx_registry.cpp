/**
 * @file tx_registry.cpp
 * @brief Global transaction id uniqueness
 */

#include <cpe/engine/tx_registry.hpp>
#include <cpe/common/error.hpp>
#include <cpe/common/macros.hpp>

#include <string>

namespace cpe {

void TxRegistry::record(const Event& event) {
    if (!carries_amount(event.kind)) {
        return;
    }
    if CPE_UNLIKELY(!seen_.insert(event.tx).second) {
        throw InvalidInputError(ErrorCode::DuplicateTransaction,
            "duplicate transaction " + std::to_string(event.tx.get()));
    }
}

} // namespace cpe
