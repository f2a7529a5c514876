#include "creation_service.hpp"
#include "junk_filter.hpp"
#include "normalizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <set>

namespace {

CreateResult failure(CreateStatus status, const std::string& message) {
    return CreateResult{status, "", "", message};
}

} // namespace

std::string CreateResult::status_string() const {
    switch (status) {
        case CreateStatus::Created: return "created";
        case CreateStatus::InvalidInput: return "invalid_input";
        case CreateStatus::Conflict: return "conflict";
        case CreateStatus::NotFound: return "not_found";
        case CreateStatus::Unavailable: return "unavailable";
        case CreateStatus::NoOwnersAvailable: return "no_owners_available";
    }
    return "unknown";
}

CreationService::CreationService(Store& store, CatalogClient& catalog, RandomSource& random)
    : store_(store)
    , catalog_(catalog)
    , random_(random)
{}

bool CreationService::exists(const std::string& key) {
    auto session = store_.begin();
    return session->find_by_key(schema::POKEMON, key).has_value();
}

CreateResult CreationService::create(const std::string& raw_name) {
    std::string trimmed = util::trim(raw_name);
    if (trimmed.empty()) {
        return failure(CreateStatus::InvalidInput, "Pokemon name cannot be empty.");
    }
    
    std::string key = Normalizer::key(trimmed);
    if (exists(key)) {
        return failure(CreateStatus::Conflict,
                       "Pokemon '" + trimmed + "' already exists in db.");
    }
    
    // No transaction is open while waiting on the catalog.
    auto lookup = catalog_.lookup(key);
    switch (lookup.status) {
        case CatalogStatus::NotFound:
            return failure(CreateStatus::NotFound,
                           "Pokemon '" + trimmed + "' not identified");
        case CatalogStatus::Unavailable:
            return failure(CreateStatus::Unavailable,
                           "PokeAPI is unreachable: " + lookup.error);
        case CatalogStatus::Found:
            break;
    }
    if (!lookup.record) {
        return failure(CreateStatus::Unavailable, "PokeAPI returned no record");
    }
    
    return insert_record(*lookup.record);
}

CreateResult CreationService::insert_record(const CatalogRecord& record) {
    std::string pokemon_name = Normalizer::clean(record.name);
    if (pokemon_name.empty()) {
        return failure(CreateStatus::Unavailable, "PokeAPI returned an unnamed record");
    }
    
    // Rolled back on every early return below.
    auto session = store_.begin();
    
    std::vector<std::optional<int64_t>> type_ids;
    for (const auto& type_name : record.types) {
        if (type_ids.size() == 2) break;
        if (JunkFilter::is_junk(type_name)) {
            spdlog::warn("Skipping junk type '{}' of '{}'", type_name, pokemon_name);
            continue;
        }
        type_ids.push_back(session->find_or_insert(schema::TYPES, Normalizer::clean(type_name)));
    }
    type_ids.resize(2);
    
    std::vector<int64_t> ability_ids;
    std::set<std::string> seen;
    for (const auto& ability_name : record.abilities) {
        std::string display = Normalizer::clean(ability_name);
        if (JunkFilter::is_junk(display) || !seen.insert(Normalizer::canonical_form(display)).second) {
            continue;
        }
        ability_ids.push_back(session->find_or_insert(schema::ABILITIES, display));
    }
    
    int64_t pokemon_id = 0;
    try {
        pokemon_id = session->insert_pokemon(pokemon_name, type_ids[0], type_ids[1]);
    } catch (const UniqueViolation& e) {
        spdlog::info("Lost creation race for '{}': {}", pokemon_name, e.what());
        return failure(CreateStatus::Conflict,
                       "Pokemon '" + pokemon_name + "' already exists in db.");
    }
    
    auto trainers = session->list_named(schema::TRAINERS);
    if (trainers.empty()) {
        spdlog::error("Cannot create '{}': trainers table is empty", pokemon_name);
        return failure(CreateStatus::NoOwnersAvailable, "No trainers in DB");
    }
    const NamedRow& trainer = trainers[random_.pick_index(trainers.size())];
    
    for (int64_t ability_id : ability_ids) {
        session->insert_link(LinkRow{pokemon_id, trainer.id, ability_id});
    }
    
    session->commit();
    spdlog::info("Created pokemon {} '{}' with {} abilities, trained by '{}'",
                 pokemon_id, pokemon_name, ability_ids.size(), trainer.name);
    
    return CreateResult{
        CreateStatus::Created,
        pokemon_name,
        trainer.name,
        "Successfully created Pokemon " + pokemon_name + " who has been trained by " + trainer.name
    };
}
