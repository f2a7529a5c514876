#include "deduplicator.hpp"
#include "junk_filter.hpp"
#include "normalizer.hpp"
#include <spdlog/spdlog.h>
#include <map>

Deduplicator::Deduplicator(StoreSession& session) : session_(session) {}

int64_t Deduplicator::count_all_references(const TableSpec& target, int64_t id) {
    int64_t total = 0;
    for (const auto& ref : target.referenced_by) {
        total += session_.count_references(ref, id);
    }
    return total;
}

DedupReport Deduplicator::run(const TableSpec& target) {
    DedupReport report;
    report.table = target.table;
    
    auto rows = session_.list_named(target.table);
    report.rows_scanned = static_cast<int>(rows.size());
    
    // Rows arrive ordered by id, so the first row of each group is the canonical one.
    std::map<std::string, std::vector<NamedRow>> groups;
    
    for (const auto& row : rows) {
        if (JunkFilter::is_junk(row.name)) {
            if (target.junk_policy == JunkPolicy::DeleteUnreferenced &&
                count_all_references(target, row.id) == 0) {
                session_.delete_row(target.table, row.id);
                report.junk_removed++;
                spdlog::debug("{}: removed junk row {} '{}'", target.table, row.id, row.name);
                continue;
            }
            
            report.junk_kept++;
            spdlog::debug("{}: junk row {} '{}' is still referenced",
                          target.table, row.id, row.name);
        }
        
        groups[Normalizer::key(row.name)].push_back(row);
    }
    
    for (const auto& [key, group] : groups) {
        const NamedRow& canonical = group.front();
        
        for (size_t i = 1; i < group.size(); i++) {
            const NamedRow& superseded = group[i];
            for (const auto& ref : target.referenced_by) {
                report.references_remapped +=
                    session_.remap_references(ref, superseded.id, canonical.id);
            }
            session_.delete_row(target.table, superseded.id);
            report.duplicates_merged++;
            spdlog::debug("{}: merged row {} '{}' into {}",
                          target.table, superseded.id, superseded.name, canonical.id);
        }
        
        std::string display = Normalizer::clean(canonical.name);
        if (display != canonical.name) {
            session_.rename_row(target.table, canonical.id, display);
            report.rows_renamed++;
        }
    }
    
    return report;
}

int Deduplicator::sweep_junk(const TableSpec& target, DedupReport& report) {
    if (target.junk_policy != JunkPolicy::DeleteUnreferenced) {
        return 0;
    }
    
    int removed = 0;
    for (const auto& row : session_.list_named(target.table)) {
        if (!JunkFilter::is_junk(row.name) || count_all_references(target, row.id) > 0) {
            continue;
        }
        session_.delete_row(target.table, row.id);
        report.junk_removed++;
        report.junk_kept--;
        removed++;
        spdlog::debug("{}: removed orphaned junk row {} '{}'", target.table, row.id, row.name);
    }
    return removed;
}
