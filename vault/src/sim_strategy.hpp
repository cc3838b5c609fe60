#pragma once

#include "strategy.hpp"
#include "sim_token.hpp"
#include <functional>
#include <map>
#include <memory>

// Share-issuing sub-account that holds the asset on an InMemoryToken.
// With a lockup, units credited to a holder cannot be redeemed until
// `lockup_ms` after that holder's latest deposit.
class SimConvertibleStrategy : public ConvertibleVault {
public:
    using Clock = std::function<int64_t()>;
    
    SimConvertibleStrategy(Address address, std::shared_ptr<InMemoryToken> asset,
                           int64_t lockup_ms = 0, Clock clock = Clock());
    
    const Address& address() const override { return address_; }
    Amount deposit(const Address& caller, Amount assets, const Address& receiver) override;
    Amount redeem(const Address& caller, Amount units,
                  const Address& receiver, const Address& owner) override;
    Amount convert_to_assets(Amount units) const override;
    Amount convert_to_shares(Amount assets) const override;
    Amount balance_of(const Address& holder) const override;
    
    Amount total_assets() const { return asset_->balance_of(address_); }
    Amount total_units() const { return total_units_; }
    bool has_lockup() const { return lockup_ms_ > 0; }
    
    // Grows (or shrinks) the asset backing by bps of the current holdings.
    Amount simulate_yield(uint32_t bps);
    Amount simulate_loss(uint32_t bps);
    
private:
    Address address_;
    std::shared_ptr<InMemoryToken> asset_;
    int64_t lockup_ms_;
    Clock clock_;
    
    Amount total_units_ = 0;
    std::map<Address, Amount> units_;
    std::map<Address, int64_t> unlock_at_ms_;
};
