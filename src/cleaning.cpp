#include "cleaning.hpp"
#include <spdlog/spdlog.h>

namespace {

struct ForeignKeyCheck {
    ForeignKeyRef ref;
    const char* target;
};

// Every foreign key in pokemon and the link table.
const std::vector<ForeignKeyCheck>& foreign_keys() {
    static const std::vector<ForeignKeyCheck> checks = {
        {{schema::POKEMON, "type1_id"}, schema::TYPES},
        {{schema::POKEMON, "type2_id"}, schema::TYPES},
        {{schema::LINKS, "pokemon_id"}, schema::POKEMON},
        {{schema::LINKS, "trainer_id"}, schema::TRAINERS},
        {{schema::LINKS, "ability_id"}, schema::ABILITIES},
    };
    return checks;
}

} // namespace

CleaningOrchestrator::CleaningOrchestrator(Store& store) : store_(store) {}

std::vector<TableSpec> CleaningOrchestrator::table_plan() {
    return {
        {schema::TYPES,
         {{schema::POKEMON, "type1_id"}, {schema::POKEMON, "type2_id"}},
         JunkPolicy::DeleteUnreferenced},
        {schema::ABILITIES,
         {{schema::LINKS, "ability_id"}},
         JunkPolicy::DeleteUnreferenced},
        {schema::TRAINERS,
         {{schema::LINKS, "trainer_id"}},
         JunkPolicy::DeleteUnreferenced},
        {schema::POKEMON,
         {{schema::LINKS, "pokemon_id"}},
         JunkPolicy::DeleteUnreferenced},
    };
}

void CleaningOrchestrator::verify_links(StoreSession& session) {
    for (const auto& check : foreign_keys()) {
        int64_t dangling = session.count_dangling(check.ref, check.target);
        if (dangling > 0) {
            throw CleaningError(fmt::format("{} rows of {}.{} point at missing {} rows",
                                            dangling, check.ref.table, check.ref.column,
                                            check.target));
        }
    }
}

std::vector<DedupReport> CleaningOrchestrator::clean_all() {
    spdlog::info("Starting database cleaning...");
    std::vector<DedupReport> reports;
    
    try {
        auto session = store_.begin();
        Deduplicator dedup(*session);
        
        auto plan = table_plan();
        for (const auto& target : plan) {
            reports.push_back(dedup.run(target));
        }
        
        // Merging and junk removal in a referencing table can orphan junk
        // rows of the tables cleaned before it.
        for (size_t i = 0; i < plan.size(); i++) {
            dedup.sweep_junk(plan[i], reports[i]);
        }
        
        for (const auto& report : reports) {
            spdlog::info("Cleaned {}: {} rows, {} junk removed, {} junk kept, "
                         "{} duplicates merged, {} references remapped, {} renamed",
                         report.table, report.rows_scanned, report.junk_removed,
                         report.junk_kept, report.duplicates_merged,
                         report.references_remapped, report.rows_renamed);
            if (report.junk_kept > 0) {
                spdlog::warn("{}: kept {} junk rows that are still referenced",
                             report.table, report.junk_kept);
            }
        }
        
        verify_links(*session);
        
        for (const auto& target : plan) {
            session->enforce_unique_names(target.table);
        }
        
        session->commit();
        spdlog::info("Database cleaning finished and changes committed");
        return reports;
        
    } catch (const CleaningError& e) {
        spdlog::error("Database cleaning failed: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Database cleaning failed: {}", e.what());
        throw CleaningError(e.what());
    }
}
