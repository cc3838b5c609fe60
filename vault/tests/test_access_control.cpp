#include <catch2/catch_test_macros.hpp>
#include "../src/access_control.hpp"
#include "../src/errors.hpp"

TEST_CASE("Roles", "[access]") {
    AccessControl access("admin");
    
    SECTION("Admin grants and revokes") {
        REQUIRE_FALSE(access.has_role(Role::Manager, "ops"));
        REQUIRE(access.grant_role("admin", Role::Manager, "ops"));
        REQUIRE_FALSE(access.grant_role("admin", Role::Manager, "ops"));
        REQUIRE(access.has_role(Role::Manager, "ops"));
        REQUIRE(access.revoke_role("admin", Role::Manager, "ops"));
        REQUIRE_THROWS_AS(access.require_role(Role::Manager, "ops"), AccessDenied);
    }
    
    SECTION("Only admins manage roles") {
        access.grant_role("admin", Role::Manager, "ops");
        REQUIRE_THROWS_AS(access.grant_role("ops", Role::Manager, "mallory"), AccessDenied);
        REQUIRE_THROWS_AS(access.revoke_role("ops", Role::Admin, "admin"), AccessDenied);
    }
    
    SECTION("The last admin stays") {
        REQUIRE_THROWS_AS(access.revoke_role("admin", Role::Admin, "admin"), InsufficientState);
        access.grant_role("admin", Role::Admin, "backup");
        REQUIRE(access.revoke_role("admin", Role::Admin, "admin"));
        REQUIRE_FALSE(access.has_role(Role::Admin, "admin"));
    }
    
    SECTION("Role names") {
        REQUIRE(parse_role("manager") == Role::Manager);
        REQUIRE(role_string(Role::Admin) == "admin");
        REQUIRE_THROWS_AS(parse_role("owner"), ValidationError);
    }
}
