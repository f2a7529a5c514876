#pragma once

#include <optional>
#include <string>
#include <vector>

struct CatalogRecord {
    std::string name;
    std::vector<std::string> types;       // 1-2 entries, slot order
    std::vector<std::string> abilities;
};

enum class CatalogStatus {
    Found,
    NotFound,     // the catalog has no such entry, not retryable
    Unavailable   // transport failure or timeout, retryable
};

struct CatalogResult {
    CatalogStatus status;
    std::optional<CatalogRecord> record;
    std::string error;
};

// Read-only lookup into the external catalog.
class CatalogClient {
public:
    virtual ~CatalogClient() = default;
    
    virtual CatalogResult lookup(const std::string& name) = 0;
};
