#include <catch2/catch_test_macros.hpp>
#include "../src/strategy_registry.hpp"
#include "../src/errors.hpp"
#include "test_doubles.hpp"

TEST_CASE("Strategy registry caps", "[registry]") {
    auto token = std::make_shared<InMemoryToken>("USDC", 6);
    auto a = std::make_shared<ScriptedStrategy>("strategy:a", token);
    auto b = std::make_shared<ScriptedStrategy>("strategy:b", token);
    StrategyRegistry registry(6000);
    
    SECTION("Indices are assigned in order") {
        REQUIRE(registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1) == 0);
        REQUIRE(registry.add_strategy(DirectHandle{"direct:b"}, "b", 4000, false, 2) == 1);
        REQUIRE(registry.active_allocation_bps() == 10000);
        REQUIRE(registry.at(1).kind() == StrategyKind::Direct);
        REQUIRE(registry.at(1).address() == "direct:b");
    }
    
    SECTION("Per-strategy cap") {
        REQUIRE_THROWS_AS(registry.add_strategy(ConvertibleHandle{a}, "a", 6001, false, 1),
                          InvariantViolation);
        REQUIRE(registry.size() == 0);
    }
    
    SECTION("Aggregate cap") {
        registry.add_strategy(ConvertibleHandle{a}, "a", 6000, false, 1);
        registry.add_strategy(ConvertibleHandle{b}, "b", 4000, false, 1);
        REQUIRE_THROWS_AS(registry.add_strategy(DirectHandle{"direct:c"}, "c", 1, false, 1),
                          InvariantViolation);
        REQUIRE_THROWS_AS(registry.update_allocation(1, 4001), InvariantViolation);
        REQUIRE(registry.at(1).target_allocation_bps == 4000);
    }
    
    SECTION("Invalid handles and duplicates") {
        REQUIRE_THROWS_AS(registry.add_strategy(ConvertibleHandle{nullptr}, "x", 100, false, 1),
                          ValidationError);
        REQUIRE_THROWS_AS(registry.add_strategy(DirectHandle{""}, "x", 100, false, 1),
                          ValidationError);
        registry.add_strategy(ConvertibleHandle{a}, "a", 100, false, 1);
        REQUIRE_THROWS_AS(registry.add_strategy(ConvertibleHandle{a}, "again", 100, false, 1),
                          ValidationError);
    }
    
    SECTION("Cap above 10000 is refused") {
        REQUIRE_THROWS_AS(StrategyRegistry(10001), ValidationError);
    }
}

TEST_CASE("Strategy registry lifecycle", "[registry]") {
    auto token = std::make_shared<InMemoryToken>("USDC", 6);
    auto a = std::make_shared<ScriptedStrategy>("strategy:a", token);
    StrategyRegistry registry(6000);
    registry.add_strategy(ConvertibleHandle{a}, "a", 5000, true, 1);
    registry.add_strategy(DirectHandle{"direct:b"}, "b", 5000, false, 1);
    
    SECTION("Update returns the previous allocation") {
        REQUIRE(registry.update_allocation(0, 3000) == 5000);
        REQUIRE(registry.active_allocation_bps() == 8000);
        REQUIRE_THROWS_AS(registry.update_allocation(7, 100), ValidationError);
    }
    
    SECTION("Removal frees allocation but keeps the index") {
        REQUIRE(registry.remove_strategy(0));
        REQUIRE_FALSE(registry.remove_strategy(0));
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.active_allocation_bps() == 5000);
        REQUIRE(registry.active_indices() == std::vector<size_t>{1});
        REQUIRE_THROWS_AS(registry.update_allocation(0, 100), ValidationError);
        
        // Re-adding the same sub-account gets a new index
        REQUIRE(registry.add_strategy(ConvertibleHandle{a}, "a2", 5000, false, 2) == 2);
    }
}
