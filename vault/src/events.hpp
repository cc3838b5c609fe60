#pragma once

#include "strategy.hpp"
#include "withdrawal_queue.hpp"
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

// Observable signal emitted after an operation commits. Not stored by the vault.
struct VaultEvent {
    std::string name;
    nlohmann::json data;
    int64_t ts_ms = 0;
    
    nlohmann::json to_json() const;
};

using EventListener = std::function<void(const VaultEvent&)>;

namespace events {
    VaultEvent strategy_added(size_t index, const Strategy& strategy, int64_t ts_ms);
    VaultEvent strategy_updated(size_t index, uint32_t old_bps, uint32_t new_bps, int64_t ts_ms);
    VaultEvent strategy_removed(size_t index, int64_t ts_ms);
    VaultEvent rebalanced(Amount total_value, Amount divested, Amount invested, int64_t ts_ms);
    VaultEvent deposit(const Address& caller, const Address& receiver,
                       Amount assets, Amount shares, int64_t ts_ms);
    VaultEvent withdraw(const Address& caller, const Address& receiver, const Address& owner,
                        Amount assets, Amount shares, int64_t ts_ms);
    VaultEvent withdrawal_queued(const WithdrawalRequest& request, int64_t ts_ms);
    VaultEvent withdrawal_completed(const WithdrawalRequest& request, int64_t ts_ms);
    VaultEvent valuation_changed(Amount previous_total, Amount new_total, int64_t ts_ms);
    VaultEvent paused(const Address& by, bool is_paused, int64_t ts_ms);
    VaultEvent role_changed(const std::string& role, const Address& account,
                            const Address& by, bool granted, int64_t ts_ms);
    VaultEvent emergency_withdrawal(Amount recovered, int64_t ts_ms);
}
