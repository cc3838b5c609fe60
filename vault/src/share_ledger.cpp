#include "share_ledger.hpp"
#include "errors.hpp"
#include "util.hpp"

Amount ShareLedger::balance_of(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

Amount ShareLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

Amount ShareLedger::shares_for_assets(Amount assets, Amount total_value, Rounding rounding) const {
    if (total_supply_ == 0) {
        return assets;  // bootstrap 1:1
    }
    if (total_value == 0) {
        throw InsufficientState("vault has outstanding shares but no value");
    }
    return rounding == Rounding::Down
        ? util::mul_div_down(assets, total_supply_, total_value)
        : util::mul_div_up(assets, total_supply_, total_value);
}

Amount ShareLedger::assets_for_shares(Amount shares, Amount total_value, Rounding rounding) const {
    if (total_supply_ == 0) {
        throw InsufficientState("no shares exist");
    }
    return rounding == Rounding::Down
        ? util::mul_div_down(shares, total_value, total_supply_)
        : util::mul_div_up(shares, total_value, total_supply_);
}

void ShareLedger::mint(const Address& to, Amount shares) {
    if (to.empty()) {
        throw ValidationError("cannot mint shares to an empty address");
    }
    total_supply_ = util::checked_add(total_supply_, shares);
    balances_[to] += shares;
}

void ShareLedger::burn(const Address& from, Amount shares) {
    Amount balance = balance_of(from);
    if (balance < shares) {
        throw InsufficientState(from + " holds " + std::to_string(balance) +
                                " shares, needs " + std::to_string(shares));
    }
    balances_[from] = balance - shares;
    total_supply_ -= shares;
    if (balances_[from] == 0) {
        balances_.erase(from);
    }
}

void ShareLedger::transfer(const Address& from, const Address& to, Amount shares) {
    if (to.empty()) {
        throw ValidationError("cannot transfer shares to an empty address");
    }
    Amount balance = balance_of(from);
    if (balance < shares) {
        throw InsufficientState(from + " holds " + std::to_string(balance) +
                                " shares, needs " + std::to_string(shares));
    }
    if (from == to || shares == 0) return;
    
    balances_[from] = balance - shares;
    if (balances_[from] == 0) {
        balances_.erase(from);
    }
    balances_[to] += shares;
}

void ShareLedger::approve(const Address& owner, const Address& spender, Amount shares) {
    if (owner.empty() || spender.empty()) {
        throw ValidationError("approve requires owner and spender");
    }
    if (shares == 0) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = shares;
    }
}

void ShareLedger::spend_allowance(const Address& owner, const Address& spender, Amount shares) {
    if (owner == spender) return;
    
    Amount current = allowance(owner, spender);
    if (current < shares) {
        throw InsufficientState(spender + " may spend " + std::to_string(current) +
                                " shares of " + owner + ", needs " + std::to_string(shares));
    }
    approve(owner, spender, current - shares);
}

std::vector<std::pair<Address, Amount>> ShareLedger::holders() const {
    return {balances_.begin(), balances_.end()};
}
