#pragma once

#include "types.hpp"
#include <map>
#include <utility>
#include <vector>

enum class Rounding {
    Down,
    Up
};

// Ownership units of the vault. Conversion between assets and shares is
// proportional to a caller-supplied total value so every operation can
// use one valuation snapshot throughout.
class ShareLedger {
public:
    Amount total_supply() const { return total_supply_; }
    Amount balance_of(const Address& holder) const;
    Amount allowance(const Address& owner, const Address& spender) const;
    
    Amount shares_for_assets(Amount assets, Amount total_value, Rounding rounding) const;
    Amount assets_for_shares(Amount shares, Amount total_value, Rounding rounding) const;
    
    void mint(const Address& to, Amount shares);
    void burn(const Address& from, Amount shares);
    void transfer(const Address& from, const Address& to, Amount shares);
    void approve(const Address& owner, const Address& spender, Amount shares);
    // No-op when spender == owner.
    void spend_allowance(const Address& owner, const Address& spender, Amount shares);
    
    std::vector<std::pair<Address, Amount>> holders() const;
    
private:
    Amount total_supply_ = 0;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
};
