#include <catch2/catch_test_macros.hpp>
#include "../src/command_handler.hpp"
#include <limits>

namespace {

nlohmann::json command(const std::string& name, const std::string& from,
                       nlohmann::json args = nlohmann::json::object()) {
    return {
        {"corr_id", "c-" + name},
        {"cmd", name},
        {"from", {{"address", from}}},
        {"args", args}
    };
}

} // namespace

TEST_CASE("Command handler", "[commands]") {
    auto sim = std::make_shared<SimEnvironment>("USDC", 6);
    VaultParams params;
    params.admin = "admin";
    auto vault = std::make_shared<Vault>(params, sim->token());
    CommandHandler handler(vault, sim);
    
    std::vector<std::string> journaled;
    handler.set_journal([&](const Vault&, const std::string& cmd, const Address&) {
        journaled.push_back(cmd);
    });
    
    handler.handle(command("grant_role", "admin", {{"role", "manager"}, {"account", "ops"}}));
    handler.handle(command("faucet", "alice", {{"amount", 1000}}));
    handler.handle(command("approve_asset", "alice", {{"amount", 1000}}));
    
    SECTION("Deposit reply") {
        auto reply = handler.handle(command("deposit", "alice", {{"assets", 1000}}));
        REQUIRE(reply["ok"].get<bool>());
        REQUIRE(reply["corr_id"] == "c-deposit");
        REQUIRE(reply["data"]["shares"].get<Amount>() == 1000);
        REQUIRE(reply.contains("ts"));
        REQUIRE(journaled == std::vector<std::string>{"deposit"});
        
        auto balance = handler.handle(command("balance", "alice"));
        REQUIRE(balance["data"]["shares"].get<Amount>() == 1000);
        REQUIRE(balance["data"]["assets_value"].get<Amount>() == 1000);
    }
    
    SECTION("Strategies are created and allocated") {
        handler.handle(command("deposit", "alice", {{"assets", 1000}}));
        
        auto added = handler.handle(command("add_strategy", "ops",
            {{"name", "lend"}, {"kind", "convertible"}, {"allocation_bps", 6000}}));
        REQUIRE(added["ok"].get<bool>());
        REQUIRE(added["data"]["address"] == "strategy:lend");
        
        auto rebalanced = handler.handle(command("rebalance", "ops"));
        REQUIRE(rebalanced["ok"].get<bool>());
        REQUIRE(rebalanced["data"]["invested"].get<Amount>() == 600);
        
        auto queued = handler.handle(command("withdraw", "alice", {{"assets", 700}}));
        REQUIRE(queued["data"]["outcome"] == "queued");
        REQUIRE(queued["data"]["request_id"].get<uint64_t>() == 0);
        
        auto pending = handler.handle(command("pending_withdrawals", "alice"));
        REQUIRE(pending["data"].size() == 1);
        
        auto metrics = handler.metrics_json();
        REQUIRE(metrics["total_queued"].get<Amount>() == 700);
        REQUIRE(metrics["paused"] == false);
    }
    
    SECTION("Rejected commands carry the error kind") {
        auto denied = handler.handle(command("add_strategy", "alice",
            {{"name", "x"}, {"allocation_bps", 100}}));
        REQUIRE_FALSE(denied["ok"].get<bool>());
        REQUIRE(denied["error"] == "access_denied");
        REQUIRE_FALSE(sim->has_strategy("x"));
        
        auto over_cap = handler.handle(command("add_strategy", "ops",
            {{"name", "big"}, {"allocation_bps", 7000}}));
        REQUIRE(over_cap["error"] == "invariant_violation");
        REQUIRE_FALSE(sim->has_strategy("big"));
        
        auto unknown = handler.handle(command("teleport", "alice"));
        REQUIRE(unknown["error"] == "validation");
        
        auto negative = handler.handle(command("deposit", "alice", {{"assets", -5}}));
        REQUIRE(negative["error"] == "validation");
        
        auto anonymous = handler.handle({{"cmd", "deposit"}, {"args", {{"assets", 1}}}});
        REQUIRE(anonymous["error"] == "validation");
        
        auto missing = handler.handle(command("complete_withdrawal", "alice", {{"request_id", 3}}));
        REQUIRE(missing["error"] == "insufficient_state");
        
        REQUIRE(journaled.empty());
    }
    
    SECTION("Removed strategies can be registered again") {
        auto first = handler.handle(command("add_strategy", "ops",
            {{"name", "lend"}, {"allocation_bps", 5000}}));
        REQUIRE(first["data"]["index"].get<size_t>() == 0);
        
        auto duplicate = handler.handle(command("add_strategy", "ops",
            {{"name", "lend"}, {"allocation_bps", 1000}}));
        REQUIRE(duplicate["error"] == "validation");
        
        REQUIRE(handler.handle(command("remove_strategy", "ops", {{"index", 0}}))["ok"].get<bool>());
        
        auto wrong_kind = handler.handle(command("add_strategy", "ops",
            {{"name", "lend"}, {"kind", "direct"}, {"allocation_bps", 1000}}));
        REQUIRE(wrong_kind["error"] == "validation");
        
        auto again = handler.handle(command("add_strategy", "ops",
            {{"name", "lend"}, {"allocation_bps", 4000}}));
        REQUIRE(again["ok"].get<bool>());
        REQUIRE(again["data"]["index"].get<size_t>() == 1);
        REQUIRE(again["data"]["address"] == "strategy:lend");
        REQUIRE(vault->registry().active_indices() == std::vector<size_t>{1});
    }
    
    SECTION("Rejected strategy can be retried under the same name") {
        auto first = handler.handle(command("add_strategy", "ops",
            {{"name", "main"}, {"allocation_bps", 6000}}));
        REQUIRE(first["ok"].get<bool>());
        auto over_total = handler.handle(command("add_strategy", "ops",
            {{"name", "other"}, {"allocation_bps", 5000}}));
        REQUIRE(over_total["error"] == "invariant_violation");
        REQUIRE_FALSE(sim->has_strategy("other"));
        
        auto retried = handler.handle(command("add_strategy", "ops",
            {{"name", "other"}, {"allocation_bps", 4000}}));
        REQUIRE(retried["ok"].get<bool>());
    }
    
    SECTION("Lockup arguments are validated") {
        auto negative = handler.handle(command("add_strategy", "ops",
            {{"name", "locked"}, {"allocation_bps", 1000}, {"lockup_seconds", -60}}));
        REQUIRE(negative["error"] == "validation");
        
        auto huge = handler.handle(command("add_strategy", "ops",
            {{"name", "locked"}, {"allocation_bps", 1000},
             {"lockup_seconds", std::numeric_limits<int64_t>::max()}}));
        REQUIRE(huge["error"] == "validation");
        
        auto fractional = handler.handle(command("add_strategy", "ops",
            {{"name", "locked"}, {"allocation_bps", 1000}, {"lockup_seconds", 1.5}}));
        REQUIRE(fractional["error"] == "validation");
        REQUIRE_FALSE(sim->has_strategy("locked"));
        
        auto locked = handler.handle(command("add_strategy", "ops",
            {{"name", "locked"}, {"allocation_bps", 1000}, {"lockup_seconds", 60}}));
        REQUIRE(locked["ok"].get<bool>());
        REQUIRE(locked["data"]["has_lockup"] == true);
    }
    
    SECTION("Valuation status reports a shortfall of queued claims") {
        handler.handle(command("deposit", "alice", {{"assets", 1000}}));
        handler.handle(command("add_strategy", "ops", {{"name", "a"}, {"allocation_bps", 6000}}));
        handler.handle(command("add_strategy", "ops", {{"name", "b"}, {"allocation_bps", 4000}}));
        handler.handle(command("rebalance", "ops"));
        
        auto queued = handler.handle(command("redeem", "alice", {{"shares", 1000}}));
        REQUIRE(queued["data"]["outcome"] == "queued");
        REQUIRE(handler.handle(command("simulate_loss", "admin",
            {{"name", "a"}, {"bps", 100}}))["ok"].get<bool>());
        
        auto status = handler.valuation_status();
        REQUIRE(status["state"] == "insolvent");
        REQUIRE(status["shortfall"].get<Amount>() == 6);
        REQUIRE_FALSE(handler.valuation_available());
        REQUIRE(handler.metrics_json()["insolvent"] == true);
        
        auto rebalanced = handler.handle(command("rebalance", "ops"));
        REQUIRE(rebalanced["ok"].get<bool>());
        REQUIRE(vault->idle_balance() == 994);
        
        handler.handle(command("faucet", "bob", {{"amount", 10}}));
        handler.handle(command("approve_asset", "bob", {{"amount", 10}}));
        auto blocked = handler.handle(command("deposit", "bob", {{"assets", 10}}));
        REQUIRE(blocked["error"] == "insufficient_state");
    }
    
    SECTION("Pause blocks deposits") {
        REQUIRE(handler.handle(command("pause", "admin"))["ok"].get<bool>());
        auto reply = handler.handle(command("deposit", "alice", {{"assets", 10}}));
        REQUIRE(reply["error"] == "paused");
        REQUIRE(handler.metrics_json()["paused"] == true);
    }
    
    SECTION("Simulated yield is admin only") {
        handler.handle(command("add_strategy", "ops", {{"name", "lend"}, {"allocation_bps", 5000}}));
        auto reply = handler.handle(command("simulate_yield", "ops", {{"name", "lend"}, {"bps", 100}}));
        REQUIRE(reply["error"] == "access_denied");
        REQUIRE(handler.valuation_available());
    }
}
