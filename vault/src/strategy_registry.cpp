#include "strategy_registry.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

StrategyRegistry::StrategyRegistry(uint32_t max_allocation_bps)
    : max_allocation_bps_(max_allocation_bps)
{
    if (max_allocation_bps_ > BPS_DENOMINATOR) {
        throw ValidationError("per-strategy cap cannot exceed " +
                              std::to_string(BPS_DENOMINATOR) + " bps");
    }
}

void StrategyRegistry::check_cap(uint32_t bps) const {
    if (bps > max_allocation_bps_) {
        throw InvariantViolation("allocation " + std::to_string(bps) +
                                 " bps exceeds per-strategy cap of " +
                                 std::to_string(max_allocation_bps_) + " bps");
    }
}

void StrategyRegistry::check_index(size_t index) const {
    if (index >= strategies_.size()) {
        throw ValidationError("strategy index " + std::to_string(index) + " out of range");
    }
}

size_t StrategyRegistry::add_strategy(StrategyHandle handle, const std::string& name,
                                      uint32_t allocation_bps, bool has_lockup,
                                      int64_t now_ms) {
    Strategy strategy;
    strategy.handle = std::move(handle);
    
    if (auto c = strategy.convertible(); c && !c->vault) {
        throw ValidationError("convertible strategy handle is null");
    }
    Address address = strategy.address();
    if (address.empty()) {
        throw ValidationError("strategy address is empty");
    }
    
    for (const auto& existing : strategies_) {
        if (existing.active && existing.address() == address) {
            throw ValidationError("strategy " + address + " is already registered");
        }
    }
    
    check_cap(allocation_bps);
    if (active_allocation_bps() + allocation_bps > BPS_DENOMINATOR) {
        throw InvariantViolation("total allocation would be " +
                                 std::to_string(active_allocation_bps() + allocation_bps) + " bps");
    }
    
    strategy.name = name.empty() ? address : name;
    strategy.target_allocation_bps = allocation_bps;
    strategy.has_lockup = has_lockup;
    strategy.active = true;
    strategy.added_at_ms = now_ms;
    
    strategies_.push_back(std::move(strategy));
    size_t index = strategies_.size() - 1;
    
    spdlog::info("Strategy {} added at index {}: {} bps ({})",
                 strategies_[index].name, index, allocation_bps,
                 strategy_kind_string(strategies_[index].kind()));
    return index;
}

uint32_t StrategyRegistry::update_allocation(size_t index, uint32_t new_bps) {
    check_index(index);
    auto& strategy = strategies_[index];
    
    if (!strategy.active) {
        throw ValidationError("strategy " + std::to_string(index) + " is inactive");
    }
    check_cap(new_bps);
    
    uint32_t total = active_allocation_bps() - strategy.target_allocation_bps + new_bps;
    if (total > BPS_DENOMINATOR) {
        throw InvariantViolation("total allocation would be " + std::to_string(total) + " bps");
    }
    
    uint32_t old_bps = strategy.target_allocation_bps;
    strategy.target_allocation_bps = new_bps;
    spdlog::info("Strategy {} allocation updated: {} -> {} bps", index, old_bps, new_bps);
    return old_bps;
}

bool StrategyRegistry::remove_strategy(size_t index) {
    check_index(index);
    auto& strategy = strategies_[index];
    if (!strategy.active) return false;
    
    strategy.active = false;
    spdlog::info("Strategy {} ({}) deactivated", index, strategy.name);
    return true;
}

const Strategy& StrategyRegistry::at(size_t index) const {
    check_index(index);
    return strategies_[index];
}

std::vector<size_t> StrategyRegistry::active_indices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < strategies_.size(); i++) {
        if (strategies_[i].active) indices.push_back(i);
    }
    return indices;
}

uint32_t StrategyRegistry::active_allocation_bps() const {
    uint32_t total = 0;
    for (const auto& strategy : strategies_) {
        if (strategy.active) total += strategy.target_allocation_bps;
    }
    return total;
}
