#include <catch2/catch_test_macros.hpp>
#include "../src/query_service.hpp"
#include "memory_store.hpp"

namespace {

void seed(MemoryStore& store) {
    int64_t electric = store.add(schema::TYPES, "Electric");
    int64_t grass = store.add(schema::TYPES, "Grass");
    int64_t poison = store.add(schema::TYPES, "Poison");
    store.add(schema::TYPES, "Ice");
    
    int64_t static_ab = store.add(schema::ABILITIES, "Static");
    int64_t overgrow = store.add(schema::ABILITIES, "Overgrow");
    
    int64_t ash = store.add(schema::TRAINERS, "Ash");
    int64_t misty = store.add(schema::TRAINERS, "Misty");
    
    int64_t pikachu = store.add_pokemon("Pikachu", electric, std::nullopt);
    int64_t raichu = store.add_pokemon("Raichu", electric, std::nullopt);
    int64_t bulbasaur = store.add_pokemon("Bulbasaur", grass, poison);
    int64_t oddish = store.add_pokemon("Oddish", poison, grass);
    store.add_pokemon("Ditto", std::nullopt, std::nullopt);
    
    store.add_link(pikachu, ash, static_ab);
    store.add_link(raichu, misty, static_ab);
    store.add_link(pikachu, misty, static_ab);
    store.add_link(bulbasaur, ash, overgrow);
    store.add_link(oddish, ash, overgrow);
}

} // namespace

TEST_CASE("Lookups over the cleaned store", "[query]") {
    MemoryStore store;
    seed(store);
    QueryService queries(store);
    
    SECTION("Pokemon by ability") {
        auto result = queries.pokemon_by_ability(" static ");
        REQUIRE(result.status == QueryStatus::Ok);
        REQUIRE(result.names == std::vector<std::string>{"Pikachu", "Raichu"});
    }
    
    SECTION("Pokemon by type checks both type columns") {
        auto result = queries.pokemon_by_type("GRASS");
        REQUIRE(result.status == QueryStatus::Ok);
        REQUIRE(result.names == std::vector<std::string>{"Bulbasaur", "Oddish"});
    }
    
    SECTION("Trainers of a pokemon are distinct") {
        auto result = queries.trainers_by_pokemon("pikachu");
        REQUIRE(result.names == std::vector<std::string>{"Ash", "Misty"});
    }
    
    SECTION("Abilities of a pokemon") {
        auto result = queries.abilities_by_pokemon("Bulbasaur");
        REQUIRE(result.names == std::vector<std::string>{"Overgrow"});
    }
    
    SECTION("Misspelled lookups are corrected") {
        auto result = queries.abilities_by_pokemon("pikuchu");
        REQUIRE(result.status == QueryStatus::Ok);
        REQUIRE(result.names == std::vector<std::string>{"Static"});
    }
    
    SECTION("Existing entity without matches is an empty list") {
        REQUIRE(queries.pokemon_by_type("Ice").names.empty());
        REQUIRE(queries.pokemon_by_type("Ice").status == QueryStatus::Ok);
        REQUIRE(queries.trainers_by_pokemon("Ditto").names.empty());
    }
    
    SECTION("Empty input is invalid") {
        REQUIRE(queries.pokemon_by_ability("  ").status == QueryStatus::InvalidInput);
        REQUIRE(queries.abilities_by_pokemon("").status == QueryStatus::InvalidInput);
    }
    
    SECTION("Unknown entities are not found") {
        auto result = queries.pokemon_by_type("Shadow");
        REQUIRE(result.status == QueryStatus::NotFound);
        REQUIRE(result.message == "Type 'Shadow' not found.");
    }
}
