#include "rebalancer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

nlohmann::json RebalanceReport::to_json() const {
    nlohmann::json moves_json = nlohmann::json::array();
    for (const auto& move : moves) {
        moves_json.push_back({
            {"index", move.index},
            {"direction", move.direction == MoveDirection::Divest ? "divest" : "invest"},
            {"current", move.current},
            {"target", move.target},
            {"amount", move.amount}
        });
    }
    return {
        {"total_before", total_before},
        {"total_after", total_after},
        {"divested", divested},
        {"invested", invested},
        {"idle_after", idle_after},
        {"timestamp_ms", timestamp_ms},
        {"moves", moves_json}
    };
}

Rebalancer::Rebalancer(std::shared_ptr<AssetToken> asset, Address vault_address,
                       std::shared_ptr<ValuationOracle> oracle)
    : asset_(std::move(asset))
    , vault_address_(std::move(vault_address))
    , oracle_(std::move(oracle))
{}

RebalancePlan Rebalancer::plan(const StrategyRegistry& registry, Amount escrowed) const {
    RebalancePlan plan;
    plan.valuation = oracle_->snapshot(registry, escrowed);
    
    for (size_t index : registry.active_indices()) {
        const auto& strategy = registry.at(index);
        
        RebalanceMove move;
        move.index = index;
        move.current = plan.valuation.per_strategy[index];
        move.target = util::mul_div_down(plan.valuation.total, strategy.target_allocation_bps,
                                         BPS_DENOMINATOR);
        
        if (move.current > move.target) {
            if (strategy.kind() == StrategyKind::Direct) {
                throw InsufficientState("direct strategy " + strategy.name + " holds " +
                                        std::to_string(move.current) + " above its target of " +
                                        std::to_string(move.target) +
                                        "; direct strategies cannot be divested");
            }
            move.direction = MoveDirection::Divest;
            move.amount = move.current - move.target;
            plan.divest.push_back(move);
        } else if (move.current < move.target) {
            move.direction = MoveDirection::Invest;
            move.amount = move.target - move.current;
            plan.invest.push_back(move);
        }
    }
    return plan;
}

RebalanceReport Rebalancer::execute(const RebalancePlan& plan, const StrategyRegistry& registry,
                                    int64_t now_ms) {
    RebalanceReport report;
    report.total_before = plan.valuation.total;
    report.timestamp_ms = now_ms;
    
    std::vector<JournalEntry> journal;
    Amount escrowed = plan.valuation.escrowed;
    
    try {
        for (const auto& planned : plan.divest) {
            RebalanceMove move = planned;
            size_t mark = journal.size();
            move.amount = divest(move.index, registry.at(move.index), planned.amount, journal);
            move.units = journal.size() > mark ? journal.back().units : 0;
            report.divested += move.amount;
            report.moves.push_back(move);
            spdlog::debug("Divested {} from strategy {} (current {}, target {})",
                          move.amount, move.index, move.current, move.target);
        }
        
        Amount idle = oracle_->idle_balance();
        Amount available = idle > escrowed ? idle - escrowed : 0;
        
        for (const auto& planned : plan.invest) {
            Amount amount = std::min(planned.amount, available);
            if (amount == 0) {
                spdlog::debug("No idle balance left for strategy {} (shortfall {})",
                              planned.index, planned.amount);
                continue;
            }
            RebalanceMove move = planned;
            move.amount = invest(move.index, registry.at(move.index), amount, journal);
            move.units = journal.back().units;
            available -= move.amount;
            report.invested += move.amount;
            report.moves.push_back(move);
            spdlog::debug("Invested {} into strategy {} (current {}, target {})",
                          move.amount, move.index, move.current, move.target);
        }
        
        auto after = oracle_->snapshot(registry, escrowed);
        report.total_after = after.total;
        report.idle_after = after.idle_balance;
        
    } catch (const std::exception& e) {
        spdlog::error("Rebalance aborted: {}; unwinding {} executed moves", e.what(), journal.size());
        compensate(journal, registry);
        throw;
    }
    
    return report;
}

Amount Rebalancer::unwind_all(const StrategyRegistry& registry) {
    std::vector<JournalEntry> journal;
    Amount recovered = 0;
    
    try {
        for (size_t index = 0; index < registry.size(); index++) {
            const auto& strategy = registry.at(index);
            if (strategy.kind() == StrategyKind::Direct) {
                spdlog::warn("Skipping direct strategy {} during unwind; its balance must be "
                             "recovered manually", strategy.name);
                continue;
            }
            Amount units = oracle_->held_units(strategy);
            if (units == 0) continue;
            
            recovered += redeem_units(index, strategy, units, journal);
        }
    } catch (const std::exception& e) {
        spdlog::error("Emergency unwind aborted: {}; re-funding {} strategies", e.what(), journal.size());
        compensate(journal, registry);
        throw;
    }
    
    return recovered;
}

Amount Rebalancer::divest(size_t index, const Strategy& strategy, Amount excess,
                          std::vector<JournalEntry>& journal) {
    const auto* c = strategy.convertible();
    Amount held = oracle_->held_units(strategy);
    Amount units = 0;
    try {
        units = c->vault->convert_to_shares(excess);
        // Round up so the redeemed assets cover the excess.
        if (units < held && c->vault->convert_to_assets(units) < excess) {
            units += 1;
        }
    } catch (const std::exception& e) {
        throw ExternalFailure("strategy " + strategy.name + " conversion failed: " + e.what());
    }

    units = std::min(units, held);
    if (units == 0) return 0;
    
    return redeem_units(index, strategy, units, journal);
}

Amount Rebalancer::redeem_units(size_t index, const Strategy& strategy, Amount units,
                                std::vector<JournalEntry>& journal) {
    const auto* c = strategy.convertible();
    Amount before = oracle_->idle_balance();
    Amount reported = 0;
    try {
        reported = c->vault->redeem(vault_address_, units, vault_address_, vault_address_);
    } catch (const ExternalFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalFailure("strategy " + strategy.name + " redeem failed: " + e.what());
    }
    Amount after = oracle_->idle_balance();
    
    Amount received = after > before ? after - before : 0;
    journal.push_back({index, MoveDirection::Divest, received, units});
    
    if (after != before + reported) {
        throw ExternalFailure("strategy " + strategy.name + " reported " + std::to_string(reported) +
                              " assets redeemed but idle balance moved by " + std::to_string(received));
    }
    return received;
}

Amount Rebalancer::invest(size_t index, const Strategy& strategy, Amount amount,
                          std::vector<JournalEntry>& journal) {
    if (const auto* d = strategy.direct()) {
        bool ok = false;
        try {
            ok = asset_->transfer(vault_address_, d->account, amount);
        } catch (const std::exception& e) {
            throw ExternalFailure("transfer to direct strategy " + strategy.name + " failed: " + e.what());
        }
        if (!ok) {
            throw ExternalFailure("transfer to direct strategy " + strategy.name + " rejected");
        }
        journal.push_back({index, MoveDirection::Invest, amount, 0});
        return amount;
    }
    
    Amount before = oracle_->idle_balance();
    Amount units = deposit_into(strategy, amount);
    journal.push_back({index, MoveDirection::Invest, amount, units});
    reset_approval(strategy);
    Amount after = oracle_->idle_balance();
    
    Amount spent = before > after ? before - after : 0;
    journal.back().assets = spent;
    
    if (spent != amount) {
        throw ExternalFailure("strategy " + strategy.name + " pulled " + std::to_string(spent) +
                              " assets, expected " + std::to_string(amount));
    }
    if (units == 0) {
        throw ExternalFailure("strategy " + strategy.name + " issued no units for " +
                              std::to_string(amount) + " assets");
    }
    return amount;
}

// Leaves the approval in place on success; the caller records the minted
// units first and then calls reset_approval().
Amount Rebalancer::deposit_into(const Strategy& strategy, Amount amount) {
    const auto* c = strategy.convertible();
    const Address& spender = c->vault->address();
    
    bool approved = false;
    try {
        approved = asset_->approve(vault_address_, spender, amount);
    } catch (const std::exception& e) {
        throw ExternalFailure("approval for strategy " + strategy.name + " failed: " + e.what());
    }
    if (!approved) {
        throw ExternalFailure("approval for strategy " + strategy.name + " rejected");
    }
    
    try {
        return c->vault->deposit(vault_address_, amount, vault_address_);
    } catch (const std::exception& e) {
        try {
            reset_approval(strategy);
        } catch (const ExternalFailure& reset_error) {
            spdlog::error("{}", reset_error.what());
        }
        throw ExternalFailure("strategy " + strategy.name + " deposit failed: " + e.what());
    }
}

void Rebalancer::reset_approval(const Strategy& strategy) {
    const Address& spender = strategy.convertible()->vault->address();
    bool revoked = false;
    try {
        if (asset_->allowance(vault_address_, spender) == 0) return;
        revoked = asset_->approve(vault_address_, spender, 0);
    } catch (const std::exception& e) {
        throw ExternalFailure("could not revoke approval for strategy " + strategy.name + ": " + e.what());
    }
    if (!revoked) {
        throw ExternalFailure("could not revoke approval for strategy " + strategy.name);
    }
}

void Rebalancer::compensate(const std::vector<JournalEntry>& journal,
                            const StrategyRegistry& registry) {
    for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
        const auto& strategy = registry.at(it->index);
        try {
            if (it->direction == MoveDirection::Invest) {
                if (strategy.kind() == StrategyKind::Direct) {
                    spdlog::critical("Cannot recall {} assets from direct strategy {}",
                                     it->assets, strategy.name);
                    continue;
                }
                if (it->units == 0) continue;
                strategy.convertible()->vault->redeem(vault_address_, it->units,
                                                      vault_address_, vault_address_);
            } else {
                if (it->assets == 0) continue;
                deposit_into(strategy, it->assets);
                reset_approval(strategy);
            }
            spdlog::info("Reverted {} of {} assets on strategy {}",
                         it->direction == MoveDirection::Invest ? "investment" : "divestment",
                         it->assets, strategy.name);
        } catch (const std::exception& e) {
            spdlog::critical("Failed to revert move on strategy {}: {}", strategy.name, e.what());
        }
    }
}
