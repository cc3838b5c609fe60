#pragma once

#include "types.hpp"
#include <memory>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

enum class StrategyKind {
    Convertible,  // issues units with a published exchange rate
    Direct        // holds the asset directly, no conversion
};

std::string strategy_kind_string(StrategyKind kind);
StrategyKind parse_strategy_kind(const std::string& text);

// Capability of an external share-issuing sub-account. Every call is
// untrusted: it may throw, lie, or call back into the vault.
class ConvertibleVault {
public:
    virtual ~ConvertibleVault() = default;
    
    virtual const Address& address() const = 0;
    
    // Pulls `assets` from `caller` (needs an asset allowance) and credits units to `receiver`.
    virtual Amount deposit(const Address& caller, Amount assets, const Address& receiver) = 0;
    // Burns `units` of `owner` and pays the assets to `receiver`.
    virtual Amount redeem(const Address& caller, Amount units,
                          const Address& receiver, const Address& owner) = 0;
    
    virtual Amount convert_to_assets(Amount units) const = 0;
    virtual Amount convert_to_shares(Amount assets) const = 0;
    virtual Amount balance_of(const Address& holder) const = 0;
};

struct ConvertibleHandle {
    std::shared_ptr<ConvertibleVault> vault;
};

// The vault's balance in a direct strategy is the asset balance of `account`.
struct DirectHandle {
    Address account;
};

using StrategyHandle = std::variant<ConvertibleHandle, DirectHandle>;

struct Strategy {
    StrategyHandle handle;
    std::string name;
    uint32_t target_allocation_bps = 0;
    bool has_lockup = false;  // informational
    bool active = true;
    int64_t added_at_ms = 0;
    
    StrategyKind kind() const;
    Address address() const;
    
    const ConvertibleHandle* convertible() const { return std::get_if<ConvertibleHandle>(&handle); }
    const DirectHandle* direct() const { return std::get_if<DirectHandle>(&handle); }
};

nlohmann::json strategy_to_json(size_t index, const Strategy& strategy);
