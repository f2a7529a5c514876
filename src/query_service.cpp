#include "query_service.hpp"
#include "normalizer.hpp"
#include "util.hpp"

QueryService::QueryService(Store& store) : store_(store) {}

template <typename Fetch>
QueryResult QueryService::lookup(const char* table, const char* label,
                                 const std::string& raw_name, Fetch fetch) {
    std::string name = util::trim(raw_name);
    if (name.empty()) {
        return QueryResult{QueryStatus::InvalidInput, {},
                           std::string(label) + " name cannot be empty."};
    }
    
    auto session = store_.begin();
    auto row = session->find_by_key(table, Normalizer::key(name));
    if (!row) {
        return QueryResult{QueryStatus::NotFound, {},
                           std::string(label) + " '" + name + "' not found."};
    }
    
    return QueryResult{QueryStatus::Ok, fetch(*session, row->id), ""};
}

QueryResult QueryService::pokemon_by_ability(const std::string& ability_name) {
    return lookup(schema::ABILITIES, "Ability", ability_name,
                  [](StoreSession& s, int64_t id) { return s.pokemon_with_ability(id); });
}

QueryResult QueryService::pokemon_by_type(const std::string& type_name) {
    return lookup(schema::TYPES, "Type", type_name,
                  [](StoreSession& s, int64_t id) { return s.pokemon_with_type(id); });
}

QueryResult QueryService::trainers_by_pokemon(const std::string& pokemon_name) {
    return lookup(schema::POKEMON, "Pokemon", pokemon_name,
                  [](StoreSession& s, int64_t id) { return s.trainers_of(id); });
}

QueryResult QueryService::abilities_by_pokemon(const std::string& pokemon_name) {
    return lookup(schema::POKEMON, "Pokemon", pokemon_name,
                  [](StoreSession& s, int64_t id) { return s.abilities_of(id); });
}
