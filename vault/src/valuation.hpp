#pragma once

#include "asset_token.hpp"
#include "strategy_registry.hpp"
#include <memory>
#include <vector>

struct ValuationSnapshot {
    Amount idle_balance = 0;      // raw asset balance of the vault
    Amount escrowed = 0;          // claims of queued withdrawals
    Amount strategies_value = 0;  // sum over active strategies
    std::vector<Amount> per_strategy;  // index-aligned with the registry, 0 when inactive
    Amount total = 0;             // idle + strategies - escrowed, floored at 0
    Amount shortfall = 0;         // escrowed claims not covered by managed value
    
    Amount free_idle() const { return idle_balance > escrowed ? idle_balance - escrowed : 0; }
    bool insolvent() const { return shortfall > 0; }
};

// Read-only view of what the vault manages. Never mutates anything; a
// failing or inconsistent strategy makes the whole valuation unavailable.
class ValuationOracle {
public:
    ValuationOracle(std::shared_ptr<AssetToken> asset, Address vault_address);
    
    Amount idle_balance() const;
    Amount strategy_value(const Strategy& strategy) const;
    Amount held_units(const Strategy& strategy) const;
    
    ValuationSnapshot snapshot(const StrategyRegistry& registry, Amount escrowed) const;
    Amount total_value(const StrategyRegistry& registry, Amount escrowed) const;
    
private:
    std::shared_ptr<AssetToken> asset_;
    Address vault_address_;
};
