#include <catch2/catch_test_macros.hpp>
#include "../src/rebalancer.hpp"
#include "../src/errors.hpp"
#include "../src/sim_strategy.hpp"
#include "test_doubles.hpp"

namespace {

struct RebalanceFixture {
    std::shared_ptr<InMemoryToken> token = std::make_shared<InMemoryToken>("USDC", 6);
    StrategyRegistry registry{6000};
    std::shared_ptr<ValuationOracle> oracle = std::make_shared<ValuationOracle>(token, "vault");
    Rebalancer rebalancer{token, "vault", oracle};
    
    RebalanceReport run(Amount escrowed = 0) {
        auto plan = rebalancer.plan(registry, escrowed);
        return rebalancer.execute(plan, registry, 42);
    }
};

} // namespace

TEST_CASE("Rebalance moves capital toward targets", "[rebalancer]") {
    RebalanceFixture f;
    auto a = std::make_shared<SimConvertibleStrategy>("strategy:a", f.token);
    auto b = std::make_shared<SimConvertibleStrategy>("strategy:b", f.token);
    f.registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
    f.registry.add_strategy(ConvertibleHandle{b}, "b", 4000, false, 1);
    f.token->mint("vault", 1000);
    
    SECTION("Idle capital is invested by allocation") {
        auto report = f.run();
        REQUIRE(report.invested == 1000);
        REQUIRE(report.divested == 0);
        REQUIRE(a->total_assets() == 600);
        REQUIRE(b->total_assets() == 400);
        REQUIRE(report.idle_after == 0);
        REQUIRE(report.total_before == 1000);
        REQUIRE(report.total_after == 1000);
        REQUIRE(f.token->allowance("vault", "strategy:a") == 0);
    }
    
    SECTION("Overweight strategies are divested first") {
        f.run();
        f.registry.update_allocation(0, 3000);
        f.registry.update_allocation(1, 6000);
        
        auto report = f.run();
        REQUIRE(report.divested == 300);
        REQUIRE(report.invested == 200);
        REQUIRE(a->total_assets() == 300);
        REQUIRE(b->total_assets() == 600);
        REQUIRE(report.idle_after == 100);
        REQUIRE(report.moves.size() == 2);
        REQUIRE(report.moves[0].direction == MoveDirection::Divest);
    }
    
    SECTION("Removed strategies are left alone") {
        f.run();
        f.registry.remove_strategy(1);
        auto report = f.run();
        REQUIRE(report.total_before == 600);
        REQUIRE(a->total_assets() == 360);
        REQUIRE(b->total_assets() == 400);
        REQUIRE(report.idle_after == 240);
    }
    
    SECTION("Queued claims are funded from divestment") {
        f.run();
        auto report = f.run(500);
        REQUIRE(report.total_before == 500);
        REQUIRE(report.idle_after == 500);
        REQUIRE(a->total_assets() == 300);
        REQUIRE(b->total_assets() == 200);
    }
}

TEST_CASE("Scarce liquidity is invested in registry order", "[rebalancer]") {
    RebalanceFixture f;
    auto a = std::make_shared<ScriptedStrategy>("strategy:a", f.token);
    auto b = std::make_shared<SimConvertibleStrategy>("strategy:b", f.token);
    auto c = std::make_shared<SimConvertibleStrategy>("strategy:c", f.token);
    
    f.registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
    f.token->mint("vault", 1000);
    f.run();
    REQUIRE(f.oracle->idle_balance() == 400);
    
    // a charges 50% on exit, so divesting it yields half the planned amount
    a->exit_fee_bps = 5000;
    f.registry.update_allocation(0, 2000);
    f.registry.add_strategy(ConvertibleHandle{b}, "b", 4000, false, 2);
    f.registry.add_strategy(ConvertibleHandle{c}, "c", 4000, false, 3);
    
    auto report = f.run();
    REQUIRE(report.divested == 200);
    REQUIRE(report.invested == 600);
    REQUIRE(b->total_assets() == 400);
    REQUIRE(c->total_assets() == 200);
    REQUIRE(report.idle_after == 0);
}

TEST_CASE("Direct strategies above target block the rebalance", "[rebalancer]") {
    RebalanceFixture f;
    f.registry.add_strategy(DirectHandle{"direct:d"}, "d", 5000, false, 1);
    f.token->mint("vault", 1000);
    
    f.run();
    REQUIRE(f.token->balance_of("direct:d") == 500);
    
    f.registry.update_allocation(0, 1000);
    REQUIRE_THROWS_AS(f.rebalancer.plan(f.registry, 0), InsufficientState);
    REQUIRE(f.token->balance_of("direct:d") == 500);
    REQUIRE(f.oracle->idle_balance() == 500);
}

TEST_CASE("Failed rebalance is unwound", "[rebalancer]") {
    RebalanceFixture f;
    auto a = std::make_shared<SimConvertibleStrategy>("strategy:a", f.token);
    auto s = std::make_shared<ScriptedStrategy>("strategy:s", f.token);
    f.registry.add_strategy(ConvertibleHandle{a}, "a", 5000, false, 1);
    f.registry.add_strategy(ConvertibleHandle{s}, "s", 5000, false, 1);
    f.token->mint("vault", 1000);
    
    SECTION("Deposit failure reverts earlier investments") {
        s->fail_deposit = true;
        REQUIRE_THROWS_AS(f.run(), ExternalFailure);
        REQUIRE(f.oracle->idle_balance() == 1000);
        REQUIRE(a->balance_of("vault") == 0);
        REQUIRE(f.token->allowance("vault", "strategy:s") == 0);
    }
    
    SECTION("Strategy that misreports a redemption") {
        f.run();
        s->over_report = 5;
        f.registry.update_allocation(1, 1000);
        
        REQUIRE_THROWS_AS(f.run(), ExternalFailure);
        REQUIRE(f.oracle->idle_balance() == 0);
        REQUIRE(f.oracle->total_value(f.registry, 0) == 1000);
    }
    
    SECTION("Redemption failure leaves state untouched") {
        f.run();
        s->fail_redeem = true;
        f.registry.update_allocation(1, 1000);
        
        REQUIRE_THROWS_AS(f.run(), ExternalFailure);
        REQUIRE(a->total_assets() == 500);
        REQUIRE(f.oracle->strategy_value(f.registry.at(1)) == 500);
    }
}

TEST_CASE("Investment is unwound when the approval cannot be revoked", "[rebalancer]") {
    auto token = std::make_shared<StickyAllowanceToken>("USDC", 6);
    StrategyRegistry registry(6000);
    auto oracle = std::make_shared<ValuationOracle>(token, "vault");
    Rebalancer rebalancer(token, "vault", oracle);
    
    auto a = std::make_shared<SimConvertibleStrategy>("strategy:a", token);
    registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
    token->mint("vault", 1000);
    token->refuse_revoke = true;
    
    auto plan = rebalancer.plan(registry, 0);
    REQUIRE(plan.invest.size() == 1);
    REQUIRE_THROWS_AS(rebalancer.execute(plan, registry, 42), ExternalFailure);
    REQUIRE(a->balance_of("vault") == 0);
    REQUIRE(a->total_assets() == 0);
    REQUIRE(oracle->idle_balance() == 1000);
    
    token->refuse_revoke = false;
    auto report = rebalancer.execute(rebalancer.plan(registry, 0), registry, 43);
    REQUIRE(report.invested == 600);
    REQUIRE(token->allowance("vault", "strategy:a") == 0);
}

TEST_CASE("Emergency unwind", "[rebalancer]") {
    RebalanceFixture f;
    auto a = std::make_shared<SimConvertibleStrategy>("strategy:a", f.token);
    f.registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
    f.registry.add_strategy(DirectHandle{"direct:d"}, "d", 4000, false, 1);
    f.token->mint("vault", 1000);
    f.run();
    
    Amount recovered = f.rebalancer.unwind_all(f.registry);
    REQUIRE(recovered == 600);
    REQUIRE(f.oracle->idle_balance() == 600);
    REQUIRE(f.token->balance_of("direct:d") == 400);
}
