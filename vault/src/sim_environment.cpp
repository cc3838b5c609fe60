#include "sim_environment.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SimEnvironment::SimEnvironment(const std::string& asset_symbol, int decimals, Clock clock)
    : token_(std::make_shared<InMemoryToken>(asset_symbol, decimals))
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
{}

StrategyHandle SimEnvironment::create_strategy(const std::string& name, StrategyKind kind,
                                               int64_t lockup_ms) {
    if (name.empty()) {
        throw ValidationError("strategy name is required");
    }
    if (strategies_.count(name)) {
        throw ValidationError("sub-account " + name + " already exists");
    }
    
    Entry entry;
    entry.kind = kind;
    
    if (kind == StrategyKind::Convertible) {
        entry.address = "strategy:" + name;
        entry.convertible = std::make_shared<SimConvertibleStrategy>(entry.address, token_,
                                                                     lockup_ms, clock_);
        strategies_[name] = entry;
        spdlog::info("Created convertible sub-account {} (lockup {} ms)", entry.address, lockup_ms);
        return ConvertibleHandle{entry.convertible};
    }
    
    entry.address = "direct:" + name;
    strategies_[name] = entry;
    spdlog::info("Created direct sub-account {}", entry.address);
    return DirectHandle{entry.address};
}

bool SimEnvironment::has_strategy(const std::string& name) const {
    return strategies_.count(name) > 0;
}

StrategyHandle SimEnvironment::strategy_handle(const std::string& name, StrategyKind kind) const {
    const auto& entry = find(name);
    if (entry.kind != kind) {
        throw ValidationError("sub-account " + name + " is " + strategy_kind_string(entry.kind) +
                              ", not " + strategy_kind_string(kind));
    }
    if (entry.convertible) {
        return ConvertibleHandle{entry.convertible};
    }
    return DirectHandle{entry.address};
}

const SimEnvironment::Entry& SimEnvironment::find(const std::string& name) const {
    auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        throw ValidationError("unknown sub-account " + name);
    }
    return it->second;
}

Amount SimEnvironment::simulate_yield(const std::string& name, uint32_t bps) {
    const auto& entry = find(name);
    if (entry.convertible) {
        return entry.convertible->simulate_yield(bps);
    }
    Amount gain = util::mul_div_down(token_->balance_of(entry.address), bps, BPS_DENOMINATOR);
    token_->mint(entry.address, gain);
    return gain;
}

Amount SimEnvironment::simulate_loss(const std::string& name, uint32_t bps) {
    const auto& entry = find(name);
    if (entry.convertible) {
        return entry.convertible->simulate_loss(bps);
    }
    if (bps > BPS_DENOMINATOR) {
        throw ValidationError("loss cannot exceed 10000 bps");
    }
    Amount loss = util::mul_div_down(token_->balance_of(entry.address), bps, BPS_DENOMINATOR);
    token_->burn(entry.address, loss);
    return loss;
}
