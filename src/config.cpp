#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.pokeapi_base = get_env("POKEAPI_BASE", "https://pokeapi.co/api/v2/pokemon");
    cfg.catalog_timeout_ms = get_env_int("CATALOG_TIMEOUT_MS", 10000);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8000);
    
    cfg.service_name = get_env("SERVICE_NAME", "pokedex");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    std::string seed = get_env("RANDOM_SEED", "0");
    try {
        cfg.random_seed = std::stoull(seed);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for RANDOM_SEED, seeding from random_device");
        cfg.random_seed = 0;
    }
    
    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (pokeapi_base.empty()) {
        throw std::runtime_error("POKEAPI_BASE must not be empty");
    }
    if (catalog_timeout_ms <= 0) {
        throw std::runtime_error("CATALOG_TIMEOUT_MS must be positive");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Catalog: {} (timeout {}ms)", pokeapi_base, catalog_timeout_ms);
    spdlog::info("  Listen: {}:{}", listen_addr, listen_port);
}
