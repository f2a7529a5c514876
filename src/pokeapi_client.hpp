#pragma once

#include "catalog_client.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <string>

class PokeApiClient : public CatalogClient {
public:
    explicit PokeApiClient(const std::string& base_url, int timeout_ms = 10000);
    
    CatalogResult lookup(const std::string& name) override;
    
    // Builds a record from a /pokemon/{name} response body. Throws on malformed input.
    static CatalogRecord parse_record(const nlohmann::json& data);
    
private:
    std::string base_url_;
    int timeout_ms_;
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
