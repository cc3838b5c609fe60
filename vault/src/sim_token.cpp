#include "sim_token.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

InMemoryToken::InMemoryToken(std::string symbol, int decimals)
    : symbol_(std::move(symbol))
    , decimals_(decimals)
{}

Amount InMemoryToken::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount InMemoryToken::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

bool InMemoryToken::transfer(const Address& from, const Address& to, Amount amount) {
    if (to.empty()) return false;
    Amount balance = balance_of(from);
    if (balance < amount) {
        spdlog::debug("{} transfer rejected: {} holds {}, needs {}", symbol_, from, balance, amount);
        return false;
    }
    if (from == to || amount == 0) return true;
    
    balances_[from] = balance - amount;
    balances_[to] += amount;
    return true;
}

bool InMemoryToken::transfer_from(const Address& spender, const Address& from,
                                  const Address& to, Amount amount) {
    Amount allowed = allowance(from, spender);
    if (allowed < amount) {
        spdlog::debug("{} transfer_from rejected: {} may spend {} of {}, needs {}",
                      symbol_, spender, allowed, from, amount);
        return false;
    }
    if (!transfer(from, to, amount)) return false;
    
    allowances_[{from, spender}] = allowed - amount;
    return true;
}

bool InMemoryToken::approve(const Address& owner, const Address& spender, Amount amount) {
    if (owner.empty() || spender.empty()) return false;
    allowances_[{owner, spender}] = amount;
    return true;
}

void InMemoryToken::mint(const Address& to, Amount amount) {
    if (to.empty()) {
        throw std::invalid_argument("cannot mint to an empty address");
    }
    total_supply_ = util::checked_add(total_supply_, amount);
    balances_[to] += amount;
}

void InMemoryToken::burn(const Address& from, Amount amount) {
    Amount balance = balance_of(from);
    if (balance < amount) {
        throw std::invalid_argument("burn exceeds balance of " + from);
    }
    balances_[from] = balance - amount;
    total_supply_ -= amount;
}
