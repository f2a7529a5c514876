#pragma once

#include "store.hpp"
#include <string>
#include <vector>

enum class QueryStatus {
    Ok,
    InvalidInput,
    NotFound
};

struct QueryResult {
    QueryStatus status;
    std::vector<std::string> names;
    std::string message;
};

// Read-only lookups over the cleaned store. Matching is by canonical name.
class QueryService {
public:
    explicit QueryService(Store& store);
    
    QueryResult pokemon_by_ability(const std::string& ability_name);
    QueryResult pokemon_by_type(const std::string& type_name);
    QueryResult trainers_by_pokemon(const std::string& pokemon_name);
    QueryResult abilities_by_pokemon(const std::string& pokemon_name);
    
private:
    Store& store_;
    
    template <typename Fetch>
    QueryResult lookup(const char* table, const char* label,
                       const std::string& raw_name, Fetch fetch);
};
