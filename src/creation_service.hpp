#pragma once

#include "catalog_client.hpp"
#include "random_source.hpp"
#include "store.hpp"
#include <string>

enum class CreateStatus {
    Created,
    InvalidInput,
    Conflict,
    NotFound,
    Unavailable,
    NoOwnersAvailable
};

struct CreateResult {
    CreateStatus status;
    std::string pokemon_name;
    std::string trainer_name;
    std::string message;
    
    bool ok() const { return status == CreateStatus::Created; }
    std::string status_string() const;
};

// Adds a pokemon from the catalog together with its types, abilities and a
// randomly assigned trainer. All rows are written in one transaction.
class CreationService {
public:
    CreationService(Store& store, CatalogClient& catalog, RandomSource& random);
    
    CreateResult create(const std::string& raw_name);
    
private:
    Store& store_;
    CatalogClient& catalog_;
    RandomSource& random_;
    
    bool exists(const std::string& key);
    CreateResult insert_record(const CatalogRecord& record);
};
