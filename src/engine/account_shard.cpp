/**
 * @file account_shard.cpp
 * @brief Event application for one shard
 */

#include <cpe/engine/account_shard.hpp>
#include <cpe/engine/validator.hpp>
#include <cpe/logging/async_logger.hpp>

namespace cpe {

ApplyResult AccountShard::apply(const Event& event) {
    stats_.events_received.fetch_add(1, std::memory_order_relaxed);

    // Events reaching a shard directly (replay, tests) get the same checks
    EventValidator::check(event);

    ApplyResult result = ApplyResult::UnknownClient;

    switch (event.kind) {
        case EventKind::Deposit:
            result = get_or_create(event.client).deposit(event.tx, *event.amount);
            break;

        case EventKind::Withdrawal:
            result = get_or_create(event.client).withdraw(event.tx, *event.amount);
            break;

        case EventKind::Dispute:
        case EventKind::Resolve:
        case EventKind::Chargeback: {
            auto it = accounts_.find(event.client);
            if (it == accounts_.end()) {
                break;
            }
            ClientAccount& account = it->second;
            if (event.kind == EventKind::Dispute) {
                result = account.dispute(event.tx);
            } else if (event.kind == EventKind::Resolve) {
                result = account.resolve(event.tx);
            } else {
                result = account.chargeback(event.tx);
                if (result == ApplyResult::Applied && logger_) {
                    logger_->info("shard %zu: client %u locked by chargeback of tx %u",
                                  index_, static_cast<unsigned>(event.client.get()),
                                  static_cast<unsigned>(event.tx.get()));
                }
            }
            break;
        }
    }

    stats_.record(result);

    if (result != ApplyResult::Applied && logger_ && logger_->enabled(LogLevel::Debug)) {
        logger_->debug("shard %zu: ignored %s client %u tx %u: %s",
                       index_, to_string(event.kind),
                       static_cast<unsigned>(event.client.get()),
                       static_cast<unsigned>(event.tx.get()),
                       to_string(result));
    }
    return result;
}

const ClientAccount* AccountShard::find(ClientId client) const noexcept {
    auto it = accounts_.find(client);
    return it == accounts_.end() ? nullptr : &it->second;
}

ClientAccount& AccountShard::get_or_create(ClientId client) {
    auto [it, inserted] = accounts_.try_emplace(client, client);
    if (inserted) {
        stats_.accounts_created.fetch_add(1, std::memory_order_relaxed);
    }
    return it->second;
}

} // namespace cpe
