#include <catch2/catch_test_macros.hpp>
#include "../src/withdrawal_queue.hpp"
#include "../src/errors.hpp"

TEST_CASE("Withdrawal queue", "[queue]") {
    WithdrawalQueue queue;
    
    SECTION("Ids are per holder and sequential") {
        REQUIRE(queue.enqueue("alice", "alice", 10, 100, 1) == 0);
        REQUIRE(queue.enqueue("alice", "bob", 5, 50, 2) == 1);
        REQUIRE(queue.enqueue("carol", "carol", 1, 10, 3) == 0);
        REQUIRE(queue.total_queued_assets() == 160);
        REQUIRE(queue.pending_count() == 3);
        REQUIRE(queue.requests_for("alice")[1].receiver == "bob");
    }
    
    SECTION("A request completes exactly once") {
        queue.enqueue("alice", "alice", 10, 100, 1);
        queue.mark_completed("alice", 0, 9);
        
        auto requests = queue.requests_for("alice");
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].completed);
        REQUIRE(requests[0].completed_at_ms == 9);
        REQUIRE(queue.total_queued_assets() == 0);
        REQUIRE_THROWS_AS(queue.mark_completed("alice", 0, 10), InsufficientState);
        REQUIRE_THROWS_AS(queue.require_pending("alice", 0), InsufficientState);
    }
    
    SECTION("Unknown requests") {
        REQUIRE_THROWS_AS(queue.require_pending("nobody", 0), InsufficientState);
        queue.enqueue("alice", "alice", 10, 100, 1);
        REQUIRE_THROWS_AS(queue.require_pending("alice", 1), InsufficientState);
    }
    
    SECTION("Zero claims are refused") {
        REQUIRE_THROWS_AS(queue.enqueue("alice", "alice", 10, 0, 1), ValidationError);
        REQUIRE(queue.requests_for("alice").empty());
    }
    
    SECTION("Pending list skips completed requests") {
        queue.enqueue("alice", "alice", 10, 100, 1);
        queue.enqueue("bob", "bob", 10, 70, 1);
        queue.mark_completed("alice", 0, 2);
        auto pending = queue.all_pending();
        REQUIRE(pending.size() == 1);
        REQUIRE(pending[0].holder == "bob");
    }
}
