#pragma once

#include "types.hpp"

// The single fungible asset the vault accepts. Implementations report
// failure by returning false; they may also throw.
class AssetToken {
public:
    virtual ~AssetToken() = default;
    
    virtual Amount balance_of(const Address& account) const = 0;
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;
    virtual int decimals() const = 0;
    
    virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, Amount amount) = 0;
    virtual bool approve(const Address& owner, const Address& spender, Amount amount) = 0;
};
