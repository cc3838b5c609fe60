#pragma once

#include "sim_strategy.hpp"
#include "sim_token.hpp"
#include "strategy.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

// Local stand-in for the outside world: the asset ledger plus the
// sub-accounts strategies are registered against.
class SimEnvironment {
public:
    using Clock = std::function<int64_t()>;
    
    SimEnvironment(const std::string& asset_symbol, int decimals, Clock clock = Clock());
    
    std::shared_ptr<InMemoryToken> token() const { return token_; }
    
    // Creates the sub-account and returns the handle to register with the vault.
    StrategyHandle create_strategy(const std::string& name, StrategyKind kind, int64_t lockup_ms);
    bool has_strategy(const std::string& name) const;
    // Handle of an existing sub-account; the kind must match how it was created.
    StrategyHandle strategy_handle(const std::string& name, StrategyKind kind) const;
    
    Amount simulate_yield(const std::string& name, uint32_t bps);
    Amount simulate_loss(const std::string& name, uint32_t bps);
    
    void faucet(const Address& to, Amount amount) { token_->mint(to, amount); }
    
private:
    struct Entry {
        StrategyKind kind;
        Address address;
        std::shared_ptr<SimConvertibleStrategy> convertible;
    };
    
    std::shared_ptr<InMemoryToken> token_;
    Clock clock_;
    std::map<std::string, Entry> strategies_;
    
    const Entry& find(const std::string& name) const;
};
