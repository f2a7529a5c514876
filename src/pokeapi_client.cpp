#include "pokeapi_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <utility>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

CatalogResult unavailable(const std::string& error) {
    return CatalogResult{CatalogStatus::Unavailable, std::nullopt, error};
}

} // namespace

PokeApiClient::PokeApiClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

size_t PokeApiClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CatalogResult PokeApiClient::lookup(const std::string& name) {
    // One handle per call; requests arrive on concurrent server threads.
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return unavailable("Failed to initialize CURL for PokeAPI");
    }
    
    char* escaped = curl_easy_escape(curl.get(), name.c_str(), static_cast<int>(name.size()));
    if (!escaped) {
        return unavailable("Failed to escape catalog name");
    }
    std::string url = base_url_ + "/" + escaped;
    curl_free(escaped);
    
    std::string response_string;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        spdlog::error("PokeAPI request failed: {}", curl_easy_strerror(res));
        return unavailable(curl_easy_strerror(res));
    }
    
    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    
    if (http_code == 404) {
        spdlog::info("PokeAPI has no entry for '{}'", name);
        return CatalogResult{CatalogStatus::NotFound, std::nullopt, "not found"};
    }
    if (http_code < 200 || http_code >= 300) {
        spdlog::error("PokeAPI error ({}) for '{}'", http_code, name);
        return unavailable(fmt::format("PokeAPI error ({})", http_code));
    }
    
    try {
        auto record = parse_record(nlohmann::json::parse(response_string));
        return CatalogResult{CatalogStatus::Found, std::move(record), ""};
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse PokeAPI response: {}", e.what());
        return unavailable(e.what());
    }
}

CatalogRecord PokeApiClient::parse_record(const nlohmann::json& data) {
    CatalogRecord record;
    record.name = data.at("name").get<std::string>();
    
    std::vector<std::pair<int, std::string>> slotted;
    for (const auto& entry : data.value("types", nlohmann::json::array())) {
        if (!entry.contains("type")) continue;
        slotted.emplace_back(entry.value("slot", static_cast<int>(slotted.size()) + 1),
                             entry["type"].at("name").get<std::string>());
    }
    std::stable_sort(slotted.begin(), slotted.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    
    // Only two type columns exist
    for (const auto& [slot, type_name] : slotted) {
        if (record.types.size() == 2) break;
        record.types.push_back(type_name);
    }
    
    for (const auto& entry : data.value("abilities", nlohmann::json::array())) {
        if (!entry.contains("ability")) continue;
        record.abilities.push_back(entry["ability"].at("name").get<std::string>());
    }
    
    return record;
}
