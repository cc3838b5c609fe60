#include "vault.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json VaultMetrics::to_json() const {
    return {
        {"total_value", total_value},
        {"total_shares", total_shares},
        {"price_per_share", price_per_share},
        {"total_queued", total_queued},
        {"idle_balance", idle_balance},
        {"shortfall", shortfall},
        {"insolvent", shortfall > 0},
        {"active_strategies", active_strategies}
    };
}

nlohmann::json WithdrawalResult::to_json() const {
    nlohmann::json j = {
        {"outcome", outcome == WithdrawalOutcome::Settled ? "settled" : "queued"},
        {"assets", assets},
        {"shares", shares}
    };
    if (request_id.has_value()) {
        j["request_id"] = *request_id;
    }
    return j;
}

Vault::Vault(VaultParams params, std::shared_ptr<AssetToken> asset, Clock clock)
    : params_(std::move(params))
    , asset_(std::move(asset))
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
    , access_(params_.admin)
    , registry_(params_.max_allocation_bps)
    , oracle_(std::make_shared<ValuationOracle>(asset_, params_.address))
    , rebalancer_(asset_, params_.address, oracle_)
{
    if (!asset_) {
        throw ValidationError("vault requires an asset");
    }
    if (params_.address.empty()) {
        throw ValidationError("vault address is required");
    }
    spdlog::info("Vault {} ({}) initialized at {}: per-strategy cap {} bps",
                 params_.name, params_.symbol, params_.address, params_.max_allocation_bps);
}

void Vault::subscribe(EventListener listener) {
    listeners_.push_back(std::move(listener));
}

void Vault::emit(const VaultEvent& event) {
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Event listener failed on {}: {}", event.name, e.what());
        }
    }
}

void Vault::require_not_paused() const {
    if (paused_) {
        throw PausedError("vault is paused");
    }
}

void Vault::require_account(const Address& account, const char* what) const {
    if (account.empty()) {
        throw ValidationError(std::string(what) + " address is empty");
    }
    if (account == params_.address) {
        throw ValidationError(std::string(what) + " cannot be the vault itself");
    }
}

// New capital would only cover the shortfall of queued claims.
void Vault::require_solvent(const ValuationSnapshot& snap) const {
    if (snap.insolvent()) {
        throw InsufficientState("queued claims exceed managed value by " +
                                std::to_string(snap.shortfall));
    }
}

ValuationSnapshot Vault::valuation() const {
    return oracle_->snapshot(registry_, queue_.total_queued_assets());
}

Amount Vault::total_value() const {
    return valuation().total;
}

void Vault::record_valuation(Amount pre_operation_total, Amount post_operation_total) {
    int64_t ts = now();
    
    if (checkpoint_.has_value() && checkpoint_->total_value != pre_operation_total) {
        Amount previous = checkpoint_->total_value;
        if (pre_operation_total > previous) {
            spdlog::info("Yield accrued: {} -> {} (+{})",
                         previous, pre_operation_total, pre_operation_total - previous);
        } else {
            spdlog::warn("Loss realized: {} -> {} (-{})",
                         previous, pre_operation_total, previous - pre_operation_total);
        }
        emit(events::valuation_changed(previous, pre_operation_total, ts));
    }
    
    checkpoint_ = ValuationCheckpoint{post_operation_total, ts};
}

Amount Vault::deposit(const Address& caller, Amount assets, const Address& receiver) {
    ReentrancyGuard::Scope scope(guard_);
    require_not_paused();
    require_account(caller, "caller");
    require_account(receiver, "receiver");
    if (assets == 0) {
        throw ValidationError("deposit of zero assets");
    }
    
    auto snap = valuation();
    require_solvent(snap);
    Amount shares = shares_.shares_for_assets(assets, snap.total, Rounding::Down);
    if (shares == 0) {
        throw ValidationError("deposit of " + std::to_string(assets) + " assets would mint no shares");
    }
    Amount post_total = util::checked_add(snap.total, assets);
    
    // Funds in before any accounting is created.
    bool ok = false;
    try {
        ok = asset_->transfer_from(params_.address, caller, params_.address, assets);
    } catch (const std::exception& e) {
        throw ExternalFailure(std::string("asset transfer from caller failed: ") + e.what());
    }
    if (!ok) {
        throw ExternalFailure("asset transfer of " + std::to_string(assets) + " from " + caller + " rejected");
    }
    
    shares_.mint(receiver, shares);
    record_valuation(snap.total, post_total);
    
    spdlog::info("Deposit: {} assets from {} -> {} shares to {}", assets, caller, shares, receiver);
    emit(events::deposit(caller, receiver, assets, shares, now()));
    return shares;
}

Amount Vault::mint(const Address& caller, Amount shares, const Address& receiver) {
    ReentrancyGuard::Scope scope(guard_);
    require_not_paused();
    require_account(caller, "caller");
    require_account(receiver, "receiver");
    if (shares == 0) {
        throw ValidationError("mint of zero shares");
    }
    
    auto snap = valuation();
    require_solvent(snap);
    Amount assets = shares;
    if (shares_.total_supply() > 0) {
        if (snap.total == 0) {
            throw InsufficientState("vault has outstanding shares but no value");
        }
        assets = shares_.assets_for_shares(shares, snap.total, Rounding::Up);
    }
    Amount post_total = util::checked_add(snap.total, assets);
    
    bool ok = false;
    try {
        ok = asset_->transfer_from(params_.address, caller, params_.address, assets);
    } catch (const std::exception& e) {
        throw ExternalFailure(std::string("asset transfer from caller failed: ") + e.what());
    }
    if (!ok) {
        throw ExternalFailure("asset transfer of " + std::to_string(assets) + " from " + caller + " rejected");
    }
    
    shares_.mint(receiver, shares);
    record_valuation(snap.total, post_total);
    
    spdlog::info("Mint: {} shares to {} for {} assets from {}", shares, receiver, assets, caller);
    emit(events::deposit(caller, receiver, assets, shares, now()));
    return assets;
}

WithdrawalResult Vault::withdraw(const Address& caller, Amount assets,
                                 const Address& receiver, const Address& owner) {
    ReentrancyGuard::Scope scope(guard_);
    require_not_paused();
    require_account(caller, "caller");
    require_account(receiver, "receiver");
    require_account(owner, "owner");
    if (assets == 0) {
        throw ValidationError("withdrawal of zero assets");
    }
    
    auto snap = valuation();
    if (shares_.total_supply() == 0) {
        throw InsufficientState("no shares exist");
    }
    Amount shares = shares_.shares_for_assets(assets, snap.total, Rounding::Up);
    return settle_or_queue(caller, receiver, owner, assets, shares, snap);
}

WithdrawalResult Vault::redeem(const Address& caller, Amount shares,
                               const Address& receiver, const Address& owner) {
    ReentrancyGuard::Scope scope(guard_);
    require_not_paused();
    require_account(caller, "caller");
    require_account(receiver, "receiver");
    require_account(owner, "owner");
    if (shares == 0) {
        throw ValidationError("redemption of zero shares");
    }
    
    auto snap = valuation();
    Amount assets = shares_.assets_for_shares(shares, snap.total, Rounding::Down);
    if (assets == 0) {
        throw ValidationError("redemption of " + std::to_string(shares) + " shares is worth no assets");
    }
    return settle_or_queue(caller, receiver, owner, assets, shares, snap);
}

WithdrawalResult Vault::settle_or_queue(const Address& caller, const Address& receiver,
                                        const Address& owner, Amount assets, Amount shares,
                                        const ValuationSnapshot& snap) {
    if (shares_.balance_of(owner) < shares) {
        throw InsufficientState(owner + " holds " + std::to_string(shares_.balance_of(owner)) +
                                " shares, needs " + std::to_string(shares));
    }
    if (caller != owner && shares_.allowance(owner, caller) < shares) {
        throw InsufficientState(caller + " is not allowed to spend " + std::to_string(shares) +
                                " shares of " + owner);
    }
    if (snap.total < assets) {
        throw InsufficientState("withdrawal exceeds vault value");
    }
    
    WithdrawalResult result;
    result.assets = assets;
    result.shares = shares;
    
    if (snap.free_idle() >= assets) {
        bool ok = false;
        try {
            ok = asset_->transfer(params_.address, receiver, assets);
        } catch (const std::exception& e) {
            throw ExternalFailure(std::string("asset transfer to receiver failed: ") + e.what());
        }
        if (!ok) {
            throw ExternalFailure("asset transfer of " + std::to_string(assets) + " to " + receiver + " rejected");
        }
        
        shares_.spend_allowance(owner, caller, shares);
        shares_.burn(owner, shares);
        record_valuation(snap.total, snap.total - assets);
        
        spdlog::info("Withdrawal settled: {} shares of {} -> {} assets to {}", shares, owner, assets, receiver);
        emit(events::withdraw(caller, receiver, owner, assets, shares, now()));
        result.outcome = WithdrawalOutcome::Settled;
        return result;
    }
    
    // Not enough free liquidity: fix the claim in asset terms now.
    uint64_t id = queue_.enqueue(owner, receiver, shares, assets, now());
    shares_.spend_allowance(owner, caller, shares);
    shares_.burn(owner, shares);
    record_valuation(snap.total, snap.total - assets);
    
    emit(events::withdrawal_queued(queue_.require_pending(owner, id), now()));
    result.outcome = WithdrawalOutcome::Queued;
    result.request_id = id;
    return result;
}

Amount Vault::share_allowance(const Address& owner, const Address& spender) const {
    return shares_.allowance(owner, spender);
}

void Vault::approve_shares(const Address& owner, const Address& spender, Amount shares) {
    require_account(owner, "owner");
    require_account(spender, "spender");
    shares_.approve(owner, spender, shares);
}

void Vault::transfer_shares(const Address& from, const Address& to, Amount shares) {
    ReentrancyGuard::Scope scope(guard_);
    require_account(from, "sender");
    require_account(to, "recipient");
    shares_.transfer(from, to, shares);
}

Amount Vault::convert_to_shares(Amount assets) const {
    return shares_.shares_for_assets(assets, total_value(), Rounding::Down);
}

Amount Vault::convert_to_assets(Amount shares) const {
    if (shares_.total_supply() == 0) {
        return shares;
    }
    return shares_.assets_for_shares(shares, total_value(), Rounding::Down);
}

size_t Vault::add_strategy(const Address& caller, StrategyHandle handle, const std::string& name,
                           uint32_t allocation_bps, bool has_lockup) {
    ReentrancyGuard::Scope scope(guard_);
    access_.require_role(Role::Manager, caller);
    
    if (auto d = std::get_if<DirectHandle>(&handle); d && d->account == params_.address) {
        throw ValidationError("strategy cannot be the vault itself");
    }
    if (auto c = std::get_if<ConvertibleHandle>(&handle); c && c->vault &&
        c->vault->address() == params_.address) {
        throw ValidationError("strategy cannot be the vault itself");
    }
    
    size_t index = registry_.add_strategy(std::move(handle), name, allocation_bps, has_lockup, now());
    emit(events::strategy_added(index, registry_.at(index), now()));
    return index;
}

void Vault::update_allocation(const Address& caller, size_t index, uint32_t new_bps) {
    ReentrancyGuard::Scope scope(guard_);
    access_.require_role(Role::Manager, caller);
    
    uint32_t old_bps = registry_.update_allocation(index, new_bps);
    emit(events::strategy_updated(index, old_bps, new_bps, now()));
}

void Vault::remove_strategy(const Address& caller, size_t index) {
    ReentrancyGuard::Scope scope(guard_);
    access_.require_role(Role::Manager, caller);
    
    if (registry_.remove_strategy(index)) {
        emit(events::strategy_removed(index, now()));
    }
}

RebalanceReport Vault::rebalance(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_);
    access_.require_role(Role::Manager, caller);
    require_not_paused();
    
    auto plan = rebalancer_.plan(registry_, queue_.total_queued_assets());
    auto report = rebalancer_.execute(plan, registry_, now());
    
    record_valuation(report.total_before, report.total_after);
    
    spdlog::info("Rebalance completed: total {} -> {}, divested {}, invested {}, idle {}",
                 report.total_before, report.total_after, report.divested,
                 report.invested, report.idle_after);
    emit(events::rebalanced(report.total_after, report.divested, report.invested, report.timestamp_ms));
    return report;
}

Amount Vault::complete_withdrawal(const Address& holder, uint64_t request_id) {
    ReentrancyGuard::Scope scope(guard_);
    require_not_paused();
    
    WithdrawalRequest request = queue_.require_pending(holder, request_id);
    
    Amount idle = oracle_->idle_balance();
    if (idle < request.assets_owed) {
        throw InsufficientState("idle balance " + std::to_string(idle) + " cannot cover request " +
                                std::to_string(request_id) + " owing " +
                                std::to_string(request.assets_owed));
    }
    
    bool ok = false;
    try {
        ok = asset_->transfer(params_.address, request.receiver, request.assets_owed);
    } catch (const std::exception& e) {
        throw ExternalFailure(std::string("asset transfer to receiver failed: ") + e.what());
    }
    if (!ok) {
        throw ExternalFailure("asset transfer of " + std::to_string(request.assets_owed) +
                              " to " + request.receiver + " rejected");
    }
    
    queue_.mark_completed(holder, request_id, now());
    
    spdlog::info("Withdrawal completed for {}: request {} paid {} assets to {}",
                 holder, request_id, request.assets_owed, request.receiver);
    emit(events::withdrawal_completed(queue_.requests_for(holder)[request_id], now()));
    return request.assets_owed;
}

std::vector<WithdrawalRequest> Vault::pending_withdrawals(const Address& holder) const {
    return queue_.requests_for(holder);
}

VaultMetrics Vault::metrics() const {
    auto snap = valuation();
    
    VaultMetrics m;
    m.total_value = snap.total;
    m.total_shares = shares_.total_supply();
    m.total_queued = queue_.total_queued_assets();
    m.idle_balance = snap.idle_balance;
    m.shortfall = snap.shortfall;
    m.active_strategies = registry_.active_indices().size();
    
    Amount one_share = util::pow10(asset_->decimals());
    m.price_per_share = m.total_shares == 0
        ? one_share
        : util::mul_div_down(one_share, snap.total, m.total_shares);
    return m;
}

void Vault::grant_role(const Address& caller, Role role, const Address& account) {
    if (access_.grant_role(caller, role, account)) {
        emit(events::role_changed(role_string(role), account, caller, true, now()));
    }
}

void Vault::revoke_role(const Address& caller, Role role, const Address& account) {
    if (access_.revoke_role(caller, role, account)) {
        emit(events::role_changed(role_string(role), account, caller, false, now()));
    }
}

void Vault::pause(const Address& caller) {
    access_.require_role(Role::Admin, caller);
    if (paused_) {
        throw InsufficientState("vault is already paused");
    }
    paused_ = true;
    spdlog::warn("Vault paused by {}", caller);
    emit(events::paused(caller, true, now()));
}

void Vault::unpause(const Address& caller) {
    access_.require_role(Role::Admin, caller);
    if (!paused_) {
        throw InsufficientState("vault is not paused");
    }
    paused_ = false;
    spdlog::info("Vault unpaused by {}", caller);
    emit(events::paused(caller, false, now()));
}

Amount Vault::emergency_withdraw_all(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_);
    access_.require_role(Role::Admin, caller);
    if (!paused_) {
        throw InsufficientState("emergency unwind requires the vault to be paused");
    }
    
    Amount recovered = rebalancer_.unwind_all(registry_);
    
    spdlog::warn("Emergency unwind by {} recovered {} assets", caller, recovered);
    emit(events::emergency_withdrawal(recovered, now()));
    return recovered;
}
