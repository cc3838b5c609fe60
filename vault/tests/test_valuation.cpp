#include <catch2/catch_test_macros.hpp>
#include "../src/valuation.hpp"
#include "../src/errors.hpp"
#include "../src/sim_strategy.hpp"
#include "test_doubles.hpp"

TEST_CASE("Valuation oracle", "[valuation]") {
    auto token = std::make_shared<InMemoryToken>("USDC", 6);
    auto a = std::make_shared<SimConvertibleStrategy>("strategy:a", token);
    StrategyRegistry registry(6000);
    ValuationOracle oracle(token, "vault");
    
    registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
    registry.add_strategy(DirectHandle{"direct:b"}, "b", 4000, false, 1);
    
    token->mint("vault", 400);
    token->mint("direct:b", 250);
    token->mint("fund", 600);
    token->approve("fund", "strategy:a", 600);
    a->deposit("fund", 600, "vault");
    
    SECTION("Idle plus strategy values") {
        auto snap = oracle.snapshot(registry, 0);
        REQUIRE(snap.idle_balance == 400);
        REQUIRE(snap.per_strategy[0] == 600);
        REQUIRE(snap.per_strategy[1] == 250);
        REQUIRE(snap.total == 1250);
    }
    
    SECTION("Convertible value follows the exchange rate") {
        a->simulate_yield(1000);
        REQUIRE(oracle.strategy_value(registry.at(0)) == 660);
        REQUIRE(oracle.total_value(registry, 0) == 1310);
    }
    
    SECTION("Queued claims are escrowed out of the total") {
        auto snap = oracle.snapshot(registry, 300);
        REQUIRE(snap.total == 950);
        REQUIRE(snap.free_idle() == 100);
        REQUIRE_FALSE(snap.insolvent());
    }
    
    SECTION("Claims above managed value floor the total at zero") {
        auto snap = oracle.snapshot(registry, 1260);
        REQUIRE(snap.total == 0);
        REQUIRE(snap.shortfall == 10);
        REQUIRE(snap.insolvent());
        REQUIRE(snap.free_idle() == 0);
        REQUIRE(oracle.total_value(registry, 1260) == 0);
    }
    
    SECTION("Inactive strategies are ignored") {
        registry.remove_strategy(1);
        auto snap = oracle.snapshot(registry, 0);
        REQUIRE(snap.per_strategy[1] == 0);
        REQUIRE(snap.total == 1000);
    }
}

TEST_CASE("Valuation rejects misbehaving strategies", "[valuation]") {
    auto token = std::make_shared<InMemoryToken>("USDC", 6);
    auto s = std::make_shared<ScriptedStrategy>("strategy:s", token);
    StrategyRegistry registry(10000);
    ValuationOracle oracle(token, "vault");
    registry.add_strategy(ConvertibleHandle{s}, "s", 5000, false, 1);
    
    token->mint("fund", 100);
    token->approve("fund", "strategy:s", 100);
    s->deposit("fund", 100, "vault");
    
    SECTION("Exchange rate that round-trips to more units") {
        s->inflate_units = 5;
        REQUIRE_THROWS_AS(oracle.total_value(registry, 0), ExternalFailure);
    }
    
    SECTION("Throwing strategy makes the valuation unavailable") {
        class Broken : public ScriptedStrategy {
        public:
            using ScriptedStrategy::ScriptedStrategy;
            Amount balance_of(const Address&) const override {
                throw std::runtime_error("node unreachable");
            }
        };
        StrategyRegistry other(10000);
        other.add_strategy(ConvertibleHandle{std::make_shared<Broken>("strategy:x", token)},
                           "x", 100, false, 1);
        REQUIRE_THROWS_AS(oracle.snapshot(other, 0), ExternalFailure);
    }
}
