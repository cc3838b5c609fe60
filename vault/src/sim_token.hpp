#pragma once

#include "asset_token.hpp"
#include <map>
#include <string>
#include <utility>

// In-memory ledger for the vault's asset, with a faucet.
class InMemoryToken : public AssetToken {
public:
    InMemoryToken(std::string symbol, int decimals);
    
    Amount balance_of(const Address& account) const override;
    Amount allowance(const Address& owner, const Address& spender) const override;
    int decimals() const override { return decimals_; }
    
    bool transfer(const Address& from, const Address& to, Amount amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount) override;
    bool approve(const Address& owner, const Address& spender, Amount amount) override;
    
    void mint(const Address& to, Amount amount);
    void burn(const Address& from, Amount amount);
    
    const std::string& symbol() const { return symbol_; }
    Amount total_supply() const { return total_supply_; }
    
private:
    std::string symbol_;
    int decimals_;
    Amount total_supply_ = 0;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
};
