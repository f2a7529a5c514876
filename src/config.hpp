#pragma once

#include <cstdint>
#include <string>

struct Config {
    // Postgres
    std::string pg_dsn;
    
    // Catalog
    std::string pokeapi_base;
    int catalog_timeout_ms;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    uint64_t random_seed;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
