#pragma once

#include "access_control.hpp"
#include "asset_token.hpp"
#include "events.hpp"
#include "reentrancy_guard.hpp"
#include "rebalancer.hpp"
#include "share_ledger.hpp"
#include "strategy_registry.hpp"
#include "valuation.hpp"
#include "withdrawal_queue.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

struct VaultParams {
    Address address = "vault";
    std::string name = "Multi Strategy Vault";
    std::string symbol = "MSV";
    Address admin;
    uint32_t max_allocation_bps = 6000;
};

struct VaultMetrics {
    Amount total_value = 0;
    Amount total_shares = 0;
    Amount price_per_share = 0;  // assets per whole share
    Amount total_queued = 0;
    Amount idle_balance = 0;
    Amount shortfall = 0;  // queued claims not backed by managed value
    size_t active_strategies = 0;
    
    nlohmann::json to_json() const;
};

struct ValuationCheckpoint {
    Amount total_value = 0;
    int64_t updated_at_ms = 0;
};

enum class WithdrawalOutcome {
    Settled,
    Queued
};

struct WithdrawalResult {
    WithdrawalOutcome outcome = WithdrawalOutcome::Settled;
    Amount assets = 0;
    Amount shares = 0;
    std::optional<uint64_t> request_id;
    
    nlohmann::json to_json() const;
};

// The pool context. Owns the share ledger, the strategy registry and the
// withdrawal queue; every balance-affecting entry point runs under one
// reentrancy guard and either completes or leaves the accounting untouched.
class Vault {
public:
    using Clock = std::function<int64_t()>;
    
    Vault(VaultParams params, std::shared_ptr<AssetToken> asset, Clock clock = Clock());
    
    const Address& address() const { return params_.address; }
    const VaultParams& params() const { return params_; }
    
    // Shares
    Amount deposit(const Address& caller, Amount assets, const Address& receiver);
    Amount mint(const Address& caller, Amount shares, const Address& receiver);
    WithdrawalResult withdraw(const Address& caller, Amount assets,
                              const Address& receiver, const Address& owner);
    WithdrawalResult redeem(const Address& caller, Amount shares,
                            const Address& receiver, const Address& owner);
    
    Amount balance_of(const Address& holder) const { return shares_.balance_of(holder); }
    Amount total_shares() const { return shares_.total_supply(); }
    Amount share_allowance(const Address& owner, const Address& spender) const;
    void approve_shares(const Address& owner, const Address& spender, Amount shares);
    void transfer_shares(const Address& from, const Address& to, Amount shares);
    
    Amount convert_to_shares(Amount assets) const;
    Amount convert_to_assets(Amount shares) const;
    
    // Strategies
    size_t add_strategy(const Address& caller, StrategyHandle handle, const std::string& name,
                        uint32_t allocation_bps, bool has_lockup);
    void update_allocation(const Address& caller, size_t index, uint32_t new_bps);
    void remove_strategy(const Address& caller, size_t index);
    const std::vector<Strategy>& list_strategies() const { return registry_.strategies(); }
    const StrategyRegistry& registry() const { return registry_; }
    
    RebalanceReport rebalance(const Address& caller);
    
    // Withdrawal queue
    Amount complete_withdrawal(const Address& holder, uint64_t request_id);
    std::vector<WithdrawalRequest> pending_withdrawals(const Address& holder) const;
    const WithdrawalQueue& queue() const { return queue_; }
    
    // Valuation
    Amount total_value() const;
    Amount idle_balance() const { return oracle_->idle_balance(); }
    VaultMetrics metrics() const;
    std::optional<ValuationCheckpoint> last_valuation() const { return checkpoint_; }
    
    // Administration
    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }
    void grant_role(const Address& caller, Role role, const Address& account);
    void revoke_role(const Address& caller, Role role, const Address& account);
    void pause(const Address& caller);
    void unpause(const Address& caller);
    bool paused() const { return paused_; }
    Amount emergency_withdraw_all(const Address& caller);
    
    void subscribe(EventListener listener);
    
private:
    VaultParams params_;
    std::shared_ptr<AssetToken> asset_;
    Clock clock_;
    
    AccessControl access_;
    ShareLedger shares_;
    StrategyRegistry registry_;
    WithdrawalQueue queue_;
    std::shared_ptr<ValuationOracle> oracle_;
    Rebalancer rebalancer_;
    ReentrancyGuard guard_;
    
    bool paused_ = false;
    std::optional<ValuationCheckpoint> checkpoint_;
    std::vector<EventListener> listeners_;
    
    int64_t now() const { return clock_(); }
    void emit(const VaultEvent& event);
    void require_not_paused() const;
    void require_account(const Address& account, const char* what) const;
    void require_solvent(const ValuationSnapshot& snap) const;
    
    ValuationSnapshot valuation() const;
    // Reports yield/loss since the last checkpoint, then moves the checkpoint.
    void record_valuation(Amount pre_operation_total, Amount post_operation_total);
    
    WithdrawalResult settle_or_queue(const Address& caller, const Address& receiver,
                                     const Address& owner, Amount assets, Amount shares,
                                     const ValuationSnapshot& snapshot);
};
