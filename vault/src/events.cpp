#include "events.hpp"

nlohmann::json VaultEvent::to_json() const {
    return {
        {"event", name},
        {"data", data},
        {"ts_ms", ts_ms}
    };
}

namespace events {

VaultEvent strategy_added(size_t index, const Strategy& strategy, int64_t ts_ms) {
    return {"strategy_added", strategy_to_json(index, strategy), ts_ms};
}

VaultEvent strategy_updated(size_t index, uint32_t old_bps, uint32_t new_bps, int64_t ts_ms) {
    return {"strategy_updated", {
        {"index", index},
        {"old_bps", old_bps},
        {"new_bps", new_bps}
    }, ts_ms};
}

VaultEvent strategy_removed(size_t index, int64_t ts_ms) {
    return {"strategy_removed", {{"index", index}}, ts_ms};
}

VaultEvent rebalanced(Amount total_value, Amount divested, Amount invested, int64_t ts_ms) {
    return {"rebalanced", {
        {"timestamp_ms", ts_ms},
        {"total_value", total_value},
        {"divested", divested},
        {"invested", invested}
    }, ts_ms};
}

VaultEvent deposit(const Address& caller, const Address& receiver,
                   Amount assets, Amount shares, int64_t ts_ms) {
    return {"deposit", {
        {"caller", caller},
        {"receiver", receiver},
        {"assets", assets},
        {"shares", shares}
    }, ts_ms};
}

VaultEvent withdraw(const Address& caller, const Address& receiver, const Address& owner,
                    Amount assets, Amount shares, int64_t ts_ms) {
    return {"withdraw", {
        {"caller", caller},
        {"receiver", receiver},
        {"owner", owner},
        {"assets", assets},
        {"shares", shares}
    }, ts_ms};
}

VaultEvent withdrawal_queued(const WithdrawalRequest& request, int64_t ts_ms) {
    return {"withdrawal_queued", {
        {"holder", request.holder},
        {"request_id", request.id},
        {"shares", request.shares_burned},
        {"assets", request.assets_owed}
    }, ts_ms};
}

VaultEvent withdrawal_completed(const WithdrawalRequest& request, int64_t ts_ms) {
    return {"withdrawal_completed", {
        {"holder", request.holder},
        {"request_id", request.id},
        {"assets", request.assets_owed}
    }, ts_ms};
}

VaultEvent valuation_changed(Amount previous_total, Amount new_total, int64_t ts_ms) {
    // Signed delta; amounts stay well inside int64 range in practice.
    int64_t delta = new_total >= previous_total
        ? static_cast<int64_t>(new_total - previous_total)
        : -static_cast<int64_t>(previous_total - new_total);
    return {"valuation_changed", {
        {"previous_total", previous_total},
        {"new_total", new_total},
        {"delta", delta}
    }, ts_ms};
}

VaultEvent paused(const Address& by, bool is_paused, int64_t ts_ms) {
    return {is_paused ? "paused" : "unpaused", {{"by", by}}, ts_ms};
}

VaultEvent role_changed(const std::string& role, const Address& account,
                        const Address& by, bool granted, int64_t ts_ms) {
    return {granted ? "role_granted" : "role_revoked", {
        {"role", role},
        {"account", account},
        {"by", by}
    }, ts_ms};
}

VaultEvent emergency_withdrawal(Amount recovered, int64_t ts_ms) {
    return {"emergency_withdrawal", {{"recovered", recovered}}, ts_ms};
}

} // namespace events
