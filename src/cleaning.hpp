#pragma once

#include "deduplicator.hpp"
#include "store.hpp"
#include <stdexcept>
#include <vector>

class CleaningError : public std::runtime_error {
public:
    explicit CleaningError(const std::string& what) : std::runtime_error(what) {}
};

// Startup repair of the whole store. Runs once, in one transaction, before
// the API accepts requests.
class CleaningOrchestrator {
public:
    explicit CleaningOrchestrator(Store& store);
    
    // Throws CleaningError; nothing is committed on failure.
    std::vector<DedupReport> clean_all();
    
    // Referenced tables first: types, abilities and trainers, then pokemon.
    static std::vector<TableSpec> table_plan();
    
private:
    Store& store_;
    
    void verify_links(StoreSession& session);
};
