#include "strategy.hpp"
#include "errors.hpp"

std::string strategy_kind_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Convertible: return "convertible";
        case StrategyKind::Direct: return "direct";
        default: return "unknown";
    }
}

StrategyKind parse_strategy_kind(const std::string& text) {
    if (text == "convertible") return StrategyKind::Convertible;
    if (text == "direct") return StrategyKind::Direct;
    throw ValidationError("unknown strategy kind: " + text);
}

StrategyKind Strategy::kind() const {
    if (convertible()) return StrategyKind::Convertible;
    return StrategyKind::Direct;
}

Address Strategy::address() const {
    if (auto c = convertible()) {
        return c->vault ? c->vault->address() : Address();
    }
    return direct()->account;
}

nlohmann::json strategy_to_json(size_t index, const Strategy& strategy) {
    return {
        {"index", index},
        {"address", strategy.address()},
        {"name", strategy.name},
        {"kind", strategy_kind_string(strategy.kind())},
        {"allocation_bps", strategy.target_allocation_bps},
        {"has_lockup", strategy.has_lockup},
        {"active", strategy.active},
        {"added_at_ms", strategy.added_at_ms}
    };
}
