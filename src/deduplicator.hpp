#pragma once

#include "store.hpp"
#include <string>
#include <vector>

enum class JunkPolicy {
    DeleteUnreferenced,   // junk rows nobody points at are dropped
    Keep                  // junk rows are cleaned like any other row
};

// Cleaning configuration for one named table.
struct TableSpec {
    std::string table;
    std::vector<ForeignKeyRef> referenced_by;
    JunkPolicy junk_policy;
};

struct DedupReport {
    std::string table;
    int rows_scanned = 0;
    int junk_removed = 0;
    int junk_kept = 0;
    int duplicates_merged = 0;
    int64_t references_remapped = 0;
    int rows_renamed = 0;
    
    bool changed() const {
        return junk_removed > 0 || duplicates_merged > 0 || rows_renamed > 0;
    }
};

class Deduplicator {
public:
    explicit Deduplicator(StoreSession& session);
    
    DedupReport run(const TableSpec& target);
    
    // Deletes junk rows that lost their last reference after later tables
    // were merged. Returns the number of rows removed.
    int sweep_junk(const TableSpec& target, DedupReport& report);
    
private:
    StoreSession& session_;
    
    int64_t count_all_references(const TableSpec& target, int64_t id);
};
