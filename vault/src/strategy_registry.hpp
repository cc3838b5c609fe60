#pragma once

#include "strategy.hpp"
#include <vector>

// Append-only list of strategies. Indices are stable handles and are
// never reused; removal only clears the active flag.
class StrategyRegistry {
public:
    explicit StrategyRegistry(uint32_t max_allocation_bps);
    
    size_t add_strategy(StrategyHandle handle, const std::string& name,
                        uint32_t allocation_bps, bool has_lockup, int64_t now_ms);
    // Returns the previous allocation.
    uint32_t update_allocation(size_t index, uint32_t new_bps);
    // Returns false when the strategy was already inactive.
    bool remove_strategy(size_t index);
    
    const Strategy& at(size_t index) const;
    const std::vector<Strategy>& strategies() const { return strategies_; }
    size_t size() const { return strategies_.size(); }
    
    std::vector<size_t> active_indices() const;
    uint32_t active_allocation_bps() const;
    uint32_t max_allocation_bps() const { return max_allocation_bps_; }
    
private:
    uint32_t max_allocation_bps_;
    std::vector<Strategy> strategies_;
    
    void check_cap(uint32_t bps) const;
    void check_index(size_t index) const;
};
