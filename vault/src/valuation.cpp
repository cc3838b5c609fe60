#include "valuation.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ValuationOracle::ValuationOracle(std::shared_ptr<AssetToken> asset, Address vault_address)
    : asset_(std::move(asset))
    , vault_address_(std::move(vault_address))
{}

Amount ValuationOracle::idle_balance() const {
    try {
        return asset_->balance_of(vault_address_);
    } catch (const std::exception& e) {
        throw ExternalFailure(std::string("asset balance unavailable: ") + e.what());
    }
}

Amount ValuationOracle::held_units(const Strategy& strategy) const {
    const auto* c = strategy.convertible();
    if (!c) {
        throw ValidationError("strategy " + strategy.name + " does not issue units");
    }
    try {
        return c->vault->balance_of(vault_address_);
    } catch (const std::exception& e) {
        throw ExternalFailure("strategy " + strategy.name + " balance_of failed: " + e.what());
    }
}

Amount ValuationOracle::strategy_value(const Strategy& strategy) const {
    if (const auto* d = strategy.direct()) {
        try {
            return asset_->balance_of(d->account);
        } catch (const std::exception& e) {
            throw ExternalFailure("strategy " + strategy.name + " balance unavailable: " + e.what());
        }
    }
    
    const auto* c = strategy.convertible();
    Amount units = held_units(strategy);
    if (units == 0) return 0;
    
    Amount assets = 0;
    Amount units_back = 0;
    try {
        assets = c->vault->convert_to_assets(units);
        units_back = c->vault->convert_to_shares(assets);
    } catch (const std::exception& e) {
        throw ExternalFailure("strategy " + strategy.name + " conversion failed: " + e.what());
    }
    
    // Both conversions round down, so converting back can never yield more units.
    if (units_back > units) {
        throw ExternalFailure("strategy " + strategy.name + " reports an inconsistent exchange rate: " +
                              std::to_string(units) + " units -> " + std::to_string(assets) +
                              " assets -> " + std::to_string(units_back) + " units");
    }
    return assets;
}

ValuationSnapshot ValuationOracle::snapshot(const StrategyRegistry& registry, Amount escrowed) const {
    ValuationSnapshot snap;
    snap.idle_balance = idle_balance();
    snap.escrowed = escrowed;
    snap.per_strategy.assign(registry.size(), 0);
    
    for (size_t index : registry.active_indices()) {
        Amount value = strategy_value(registry.at(index));
        snap.per_strategy[index] = value;
        snap.strategies_value = util::checked_add(snap.strategies_value, value);
    }
    
    Amount gross = util::checked_add(snap.idle_balance, snap.strategies_value);
    if (gross < escrowed) {
        snap.shortfall = escrowed - gross;
        spdlog::warn("Managed value {} is below queued claims of {} (shortfall {})",
                     gross, escrowed, snap.shortfall);
    } else {
        snap.total = gross - escrowed;
    }
    
    spdlog::debug("Valuation: idle={} strategies={} escrowed={} total={} shortfall={}",
                  snap.idle_balance, snap.strategies_value, escrowed, snap.total, snap.shortfall);
    return snap;
}

Amount ValuationOracle::total_value(const StrategyRegistry& registry, Amount escrowed) const {
    return snapshot(registry, escrowed).total;
}
