#include <catch2/catch_test_macros.hpp>
#include "../src/pokeapi_client.hpp"

TEST_CASE("PokeAPI response parsing", "[catalog]") {
    SECTION("Types follow slot order and abilities keep order") {
        nlohmann::json data = {
            {"id", 1},
            {"name", "bulbasaur"},
            {"types", {
                {{"slot", 2}, {"type", {{"name", "poison"}}}},
                {{"slot", 1}, {"type", {{"name", "grass"}}}}
            }},
            {"abilities", {
                {{"ability", {{"name", "overgrow"}}}, {"is_hidden", false}},
                {{"ability", {{"name", "chlorophyll"}}}, {"is_hidden", true}}
            }}
        };
        
        auto record = PokeApiClient::parse_record(data);
        
        REQUIRE(record.name == "bulbasaur");
        REQUIRE(record.types == std::vector<std::string>{"grass", "poison"});
        REQUIRE(record.abilities == std::vector<std::string>{"overgrow", "chlorophyll"});
    }
    
    SECTION("At most two types are kept") {
        nlohmann::json data = {
            {"name", "oddity"},
            {"types", {
                {{"slot", 1}, {"type", {{"name", "fire"}}}},
                {{"slot", 2}, {"type", {{"name", "water"}}}},
                {{"slot", 3}, {"type", {{"name", "grass"}}}}
            }}
        };
        
        auto record = PokeApiClient::parse_record(data);
        
        REQUIRE(record.types.size() == 2);
        REQUIRE(record.abilities.empty());
    }
    
    SECTION("Missing name is malformed") {
        nlohmann::json data = {{"types", nlohmann::json::array()}};
        REQUIRE_THROWS(PokeApiClient::parse_record(data));
    }
}

TEST_CASE("PokeAPI transport failures", "[catalog]") {
    SECTION("Refused connection is unavailable, not missing") {
        PokeApiClient client("http://127.0.0.1:1/api/v2/pokemon", 2000);
        
        auto result = client.lookup("pikachu");
        
        REQUIRE(result.status == CatalogStatus::Unavailable);
        REQUIRE_FALSE(result.record.has_value());
    }
}
