#include "command_handler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// One year.
constexpr Amount MAX_LOCKUP_SECONDS = 365ULL * 24 * 3600;

Amount require_amount(const nlohmann::json& args, const char* key) {
    if (!args.contains(key)) {
        throw ValidationError(std::string("missing argument: ") + key);
    }
    const auto& value = args[key];
    if (value.is_number_unsigned()) {
        return value.get<Amount>();
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<Amount>(value.get<int64_t>());
    }
    throw ValidationError(std::string("argument ") + key + " must be a non-negative integer");
}

uint32_t require_bps(const nlohmann::json& args, const char* key) {
    Amount value = require_amount(args, key);
    if (value > BPS_DENOMINATOR) {
        throw ValidationError(std::string("argument ") + key + " exceeds 10000 bps");
    }
    return static_cast<uint32_t>(value);
}

std::string require_string(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
        throw ValidationError(std::string("missing argument: ") + key);
    }
    return args[key].get<std::string>();
}

std::string optional_string(const nlohmann::json& args, const char* key, const std::string& fallback) {
    if (!args.contains(key)) return fallback;
    if (!args[key].is_string()) {
        throw ValidationError(std::string("argument ") + key + " must be a string");
    }
    return args[key].get<std::string>();
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return "";
    return obj[key].get<std::string>();
}

nlohmann::json requests_json(const std::vector<WithdrawalRequest>& requests) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& request : requests) {
        list.push_back(request_to_json(request));
    }
    return list;
}

} // namespace

CommandHandler::CommandHandler(std::shared_ptr<Vault> vault, std::shared_ptr<SimEnvironment> sim)
    : vault_(std::move(vault))
    , sim_(std::move(sim))
{}

nlohmann::json CommandHandler::handle(const nlohmann::json& cmd) {
    std::string corr_id = string_field(cmd, "corr_id");
    std::string name = string_field(cmd, "cmd");
    
    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"cmd", name}
    };
    
    try {
        Address caller;
        if (cmd.is_object() && cmd.contains("from")) {
            caller = string_field(cmd["from"], "address");
        }
        if (caller.empty()) {
            throw ValidationError("command has no caller address");
        }
        nlohmann::json args = cmd.contains("args") && cmd["args"].is_object()
            ? cmd["args"] : nlohmann::json::object();
        
        std::lock_guard<std::mutex> lock(mutex_);
        
        std::string message;
        Address holder = caller;
        bool mutated = false;
        nlohmann::json data = dispatch(name, caller, args, message, holder, mutated);
        
        // The command has committed; a journal failure must not turn it into a rejection.
        if (mutated && journal_) {
            try {
                journal_(*vault_, name, holder);
            } catch (const std::exception& e) {
                spdlog::error("Failed to journal {}: {}", name, e.what());
            }
        }
        
        reply["ok"] = true;
        reply["message"] = message;
        reply["data"] = data;
        spdlog::info("Processed {} from {}", name, caller);
        
    } catch (const VaultError& e) {
        reply["ok"] = false;
        reply["error"] = error_kind_string(e.kind());
        reply["message"] = e.what();
        spdlog::warn("Rejected {}: [{}] {}", name, error_kind_string(e.kind()), e.what());
    } catch (const nlohmann::json::exception& e) {
        reply["ok"] = false;
        reply["error"] = error_kind_string(ErrorKind::Validation);
        reply["message"] = std::string("malformed arguments: ") + e.what();
        spdlog::warn("Rejected {}: malformed arguments: {}", name, e.what());
    } catch (const std::exception& e) {
        reply["ok"] = false;
        reply["error"] = "internal";
        reply["message"] = e.what();
        spdlog::error("Failed to handle {}: {}", name, e.what());
    }
    
    reply["ts"] = util::current_iso8601();
    return reply;
}

nlohmann::json CommandHandler::dispatch(const std::string& cmd, const Address& caller,
                                        const nlohmann::json& args, std::string& message,
                                        Address& holder, bool& mutated) {
    auto& vault = *vault_;
    
    if (cmd == "deposit") {
        Amount assets = require_amount(args, "assets");
        Address receiver = optional_string(args, "receiver", caller);
        Amount shares = vault.deposit(caller, assets, receiver);
        mutated = true;
        message = "Deposited " + std::to_string(assets) + " assets for " + std::to_string(shares) + " shares";
        return {{"assets", assets}, {"shares", shares}};
    }
    
    if (cmd == "mint") {
        Amount shares = require_amount(args, "shares");
        Address receiver = optional_string(args, "receiver", caller);
        Amount assets = vault.mint(caller, shares, receiver);
        mutated = true;
        message = "Minted " + std::to_string(shares) + " shares for " + std::to_string(assets) + " assets";
        return {{"assets", assets}, {"shares", shares}};
    }
    
    if (cmd == "withdraw" || cmd == "redeem") {
        Address receiver = optional_string(args, "receiver", caller);
        holder = optional_string(args, "owner", caller);
        WithdrawalResult result = cmd == "withdraw"
            ? vault.withdraw(caller, require_amount(args, "assets"), receiver, holder)
            : vault.redeem(caller, require_amount(args, "shares"), receiver, holder);
        mutated = true;
        if (result.outcome == WithdrawalOutcome::Settled) {
            message = "Paid " + std::to_string(result.assets) + " assets";
        } else {
            message = "Insufficient liquidity: withdrawal of " + std::to_string(result.assets) +
                      " queued as request " + std::to_string(*result.request_id);
        }
        return result.to_json();
    }
    
    if (cmd == "approve_shares") {
        Address spender = require_string(args, "spender");
        Amount shares = require_amount(args, "shares");
        vault.approve_shares(caller, spender, shares);
        message = "Approved " + spender + " for " + std::to_string(shares) + " shares";
        return {{"spender", spender}, {"shares", shares}};
    }
    
    if (cmd == "transfer_shares") {
        Address to = require_string(args, "to");
        Amount shares = require_amount(args, "shares");
        vault.transfer_shares(caller, to, shares);
        mutated = true;
        message = "Transferred " + std::to_string(shares) + " shares to " + to;
        return {{"to", to}, {"shares", shares}};
    }
    
    if (cmd == "balance") {
        holder = optional_string(args, "holder", caller);
        Amount shares = vault.balance_of(holder);
        message = holder + " holds " + std::to_string(shares) + " shares";
        return {
            {"holder", holder},
            {"shares", shares},
            {"assets_value", vault.convert_to_assets(shares)},
            {"asset_balance", sim_->token()->balance_of(holder)}
        };
    }
    
    if (cmd == "add_strategy") {
        vault.access().require_role(Role::Manager, caller);
        std::string name = require_string(args, "name");
        StrategyKind kind = parse_strategy_kind(optional_string(args, "kind", "convertible"));
        uint32_t bps = require_bps(args, "allocation_bps");
        int64_t lockup_ms = 0;
        if (args.contains("lockup_seconds")) {
            Amount seconds = require_amount(args, "lockup_seconds");
            if (seconds > MAX_LOCKUP_SECONDS) {
                throw ValidationError("argument lockup_seconds exceeds " +
                                      std::to_string(MAX_LOCKUP_SECONDS));
            }
            lockup_ms = static_cast<int64_t>(seconds) * 1000;
        }
        bool has_lockup = lockup_ms > 0;
        if (args.contains("has_lockup")) {
            if (!args["has_lockup"].is_boolean()) {
                throw ValidationError("argument has_lockup must be a boolean");
            }
            has_lockup = args["has_lockup"].get<bool>();
        }
        
        // Validate against the registry before creating the sub-account.
        if (bps > vault.registry().max_allocation_bps()) {
            throw InvariantViolation("allocation " + std::to_string(bps) +
                                     " bps exceeds per-strategy cap of " +
                                     std::to_string(vault.registry().max_allocation_bps()) + " bps");
        }
        if (vault.registry().active_allocation_bps() + bps > BPS_DENOMINATOR) {
            throw InvariantViolation("total allocation would be " +
                                     std::to_string(vault.registry().active_allocation_bps() + bps) + " bps");
        }
        
        // A removed strategy keeps its sub-account and can be registered again.
        StrategyHandle handle = sim_->has_strategy(name)
            ? sim_->strategy_handle(name, kind)
            : sim_->create_strategy(name, kind, lockup_ms);
        size_t index = vault.add_strategy(caller, handle, name, bps, has_lockup);
        mutated = true;
        message = "Strategy " + name + " added at index " + std::to_string(index);
        return strategy_to_json(index, vault.registry().at(index));
    }
    
    if (cmd == "update_allocation") {
        size_t index = require_amount(args, "index");
        uint32_t bps = require_bps(args, "allocation_bps");
        vault.update_allocation(caller, index, bps);
        mutated = true;
        message = "Strategy " + std::to_string(index) + " allocation set to " + std::to_string(bps) + " bps";
        return strategy_to_json(index, vault.registry().at(index));
    }
    
    if (cmd == "remove_strategy") {
        size_t index = require_amount(args, "index");
        vault.remove_strategy(caller, index);
        mutated = true;
        message = "Strategy " + std::to_string(index) + " deactivated";
        return strategy_to_json(index, vault.registry().at(index));
    }
    
    if (cmd == "rebalance") {
        auto report = vault.rebalance(caller);
        mutated = true;
        message = "Rebalanced: divested " + std::to_string(report.divested) +
                  ", invested " + std::to_string(report.invested);
        return report.to_json();
    }
    
    if (cmd == "complete_withdrawal") {
        holder = optional_string(args, "holder", caller);
        uint64_t request_id = require_amount(args, "request_id");
        Amount paid = vault.complete_withdrawal(holder, request_id);
        mutated = true;
        message = "Request " + std::to_string(request_id) + " paid " + std::to_string(paid) + " assets";
        return {{"holder", holder}, {"request_id", request_id}, {"assets", paid}};
    }
    
    if (cmd == "pending_withdrawals") {
        holder = optional_string(args, "holder", caller);
        auto requests = vault.pending_withdrawals(holder);
        message = std::to_string(requests.size()) + " withdrawal requests for " + holder;
        return requests_json(requests);
    }
    
    if (cmd == "total_value") {
        Amount total = vault.total_value();
        message = "Total value: " + std::to_string(total);
        return {{"total_value", total}};
    }
    
    if (cmd == "list_strategies") {
        nlohmann::json list = nlohmann::json::array();
        const auto& strategies = vault.list_strategies();
        for (size_t i = 0; i < strategies.size(); i++) {
            list.push_back(strategy_to_json(i, strategies[i]));
        }
        message = std::to_string(strategies.size()) + " strategies";
        return list;
    }
    
    if (cmd == "metrics") {
        message = "Vault metrics";
        return vault.metrics().to_json();
    }
    
    if (cmd == "pause") {
        vault.pause(caller);
        mutated = true;
        message = "Vault paused";
        return {{"paused", true}};
    }
    
    if (cmd == "unpause") {
        vault.unpause(caller);
        mutated = true;
        message = "Vault unpaused";
        return {{"paused", false}};
    }
    
    if (cmd == "emergency_withdraw_all") {
        Amount recovered = vault.emergency_withdraw_all(caller);
        mutated = true;
        message = "Recovered " + std::to_string(recovered) + " assets from strategies";
        return {{"recovered", recovered}};
    }
    
    if (cmd == "grant_role" || cmd == "revoke_role") {
        Role role = parse_role(require_string(args, "role"));
        Address account = require_string(args, "account");
        if (cmd == "grant_role") {
            vault.grant_role(caller, role, account);
        } else {
            vault.revoke_role(caller, role, account);
        }
        message = cmd + " " + role_string(role) + " for " + account;
        return {{"role", role_string(role)}, {"account", account}};
    }
    
    // Simulation commands
    if (cmd == "faucet") {
        Address to = optional_string(args, "to", caller);
        Amount amount = require_amount(args, "amount");
        sim_->faucet(to, amount);
        message = "Minted " + std::to_string(amount) + " " + sim_->token()->symbol() + " to " + to;
        return {{"to", to}, {"amount", amount}};
    }
    
    if (cmd == "approve_asset") {
        Amount amount = require_amount(args, "amount");
        if (!sim_->token()->approve(caller, vault.address(), amount)) {
            throw ValidationError("asset approval rejected");
        }
        message = "Approved vault for " + std::to_string(amount) + " " + sim_->token()->symbol();
        return {{"amount", amount}};
    }
    
    if (cmd == "simulate_yield" || cmd == "simulate_loss") {
        vault.access().require_role(Role::Admin, caller);
        std::string name = require_string(args, "name");
        uint32_t bps = require_bps(args, "bps");
        Amount moved = cmd == "simulate_yield"
            ? sim_->simulate_yield(name, bps)
            : sim_->simulate_loss(name, bps);
        message = cmd + " on " + name + ": " + std::to_string(moved) + " assets";
        return {{"name", name}, {"bps", bps}, {"assets", moved}};
    }
    
    throw ValidationError("unknown command: " + cmd);
}

nlohmann::json CommandHandler::metrics_json() {
    bool paused = false;
    nlohmann::json j = metrics(paused).to_json();
    j["paused"] = paused;
    return j;
}

VaultMetrics CommandHandler::metrics(bool& paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused = vault_->paused();
    return vault_->metrics();
}

nlohmann::json CommandHandler::valuation_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        VaultMetrics m = vault_->metrics();
        if (m.shortfall > 0) {
            return {{"state", "insolvent"}, {"shortfall", m.shortfall}, {"total_queued", m.total_queued}};
        }
        return {{"state", "up"}, {"total_value", m.total_value}};
    } catch (const std::exception& e) {
        spdlog::warn("Valuation unavailable: {}", e.what());
        return {{"state", "unavailable"}, {"error", e.what()}};
    }
}

bool CommandHandler::valuation_available() {
    return valuation_status()["state"] == "up";
}
