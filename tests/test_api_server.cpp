#include <catch2/catch_test_macros.hpp>
#include "../src/api_server.hpp"

TEST_CASE("HTTP status mapping", "[api]") {
    SECTION("Creation outcomes") {
        REQUIRE(http_status_for(CreateStatus::Created) == 201);
        REQUIRE(http_status_for(CreateStatus::InvalidInput) == 400);
        REQUIRE(http_status_for(CreateStatus::NotFound) == 404);
        REQUIRE(http_status_for(CreateStatus::Conflict) == 409);
        REQUIRE(http_status_for(CreateStatus::Unavailable) == 503);
        REQUIRE(http_status_for(CreateStatus::NoOwnersAvailable) == 503);
    }
    
    SECTION("Query outcomes") {
        REQUIRE(http_status_for(QueryStatus::Ok) == 200);
        REQUIRE(http_status_for(QueryStatus::InvalidInput) == 400);
        REQUIRE(http_status_for(QueryStatus::NotFound) == 404);
    }
    
    SECTION("Status strings distinguish the two 503 causes") {
        CreateResult unavailable{CreateStatus::Unavailable, "", "", ""};
        CreateResult no_owners{CreateStatus::NoOwnersAvailable, "", "", ""};
        REQUIRE(unavailable.status_string() != no_owners.status_string());
    }
}
