#pragma once

#include "valuation.hpp"
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

enum class MoveDirection {
    Divest,  // strategy -> idle
    Invest   // idle -> strategy
};

struct RebalanceMove {
    size_t index = 0;
    MoveDirection direction = MoveDirection::Invest;
    Amount current = 0;
    Amount target = 0;
    Amount amount = 0;  // planned delta; executed amount after execute()
    Amount units = 0;   // strategy units moved, convertible only
};

struct RebalancePlan {
    ValuationSnapshot valuation;
    std::vector<RebalanceMove> divest;
    std::vector<RebalanceMove> invest;  // uncapped shortfalls, registry order
};

struct RebalanceReport {
    Amount total_before = 0;
    Amount total_after = 0;
    Amount divested = 0;
    Amount invested = 0;
    Amount idle_after = 0;
    int64_t timestamp_ms = 0;
    std::vector<RebalanceMove> moves;
    
    nlohmann::json to_json() const;
};

// Moves capital between the idle balance and the strategies in two
// passes: divest everything above target, then invest shortfalls out of
// free idle balance. Targets come from one valuation snapshot.
class Rebalancer {
public:
    Rebalancer(std::shared_ptr<AssetToken> asset, Address vault_address,
               std::shared_ptr<ValuationOracle> oracle);
    
    RebalancePlan plan(const StrategyRegistry& registry, Amount escrowed) const;
    RebalanceReport execute(const RebalancePlan& plan, const StrategyRegistry& registry,
                            int64_t now_ms);
    
    // Redeems every unit held in every convertible strategy. Returns the
    // assets recovered to the idle balance.
    Amount unwind_all(const StrategyRegistry& registry);
    
private:
    struct JournalEntry {
        size_t index;
        MoveDirection direction;
        Amount assets;
        Amount units;
    };
    
    std::shared_ptr<AssetToken> asset_;
    Address vault_address_;
    std::shared_ptr<ValuationOracle> oracle_;
    
    Amount divest(size_t index, const Strategy& strategy, Amount excess,
                  std::vector<JournalEntry>& journal);
    Amount redeem_units(size_t index, const Strategy& strategy, Amount units,
                        std::vector<JournalEntry>& journal);
    Amount invest(size_t index, const Strategy& strategy, Amount amount,
                  std::vector<JournalEntry>& journal);
    Amount deposit_into(const Strategy& strategy, Amount amount);
    void reset_approval(const Strategy& strategy);
    
    void compensate(const std::vector<JournalEntry>& journal, const StrategyRegistry& registry);
};
