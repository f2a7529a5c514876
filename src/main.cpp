#include "api_server.hpp"
#include "cleaning.hpp"
#include "config.hpp"
#include "creation_service.hpp"
#include "pokeapi_client.hpp"
#include "postgres_store.hpp"
#include "query_service.hpp"
#include "random_source.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    
    try {
        auto config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Pokedex Service v1.0");
        spdlog::info("==============================================");
        
        config.validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        PostgresStore store(config.pg_dsn);
        if (!store.ping()) {
            throw std::runtime_error("Postgres is unreachable");
        }
        store.init_schema();
        
        // Requests are only served from a cleaned store.
        CleaningOrchestrator cleaner(store);
        cleaner.clean_all();
        
        PokeApiClient catalog(config.pokeapi_base, config.catalog_timeout_ms);
        SeededRandomSource random(config.random_seed);
        CreationService creator(store, catalog, random);
        QueryService queries(store);
        
        ApiServer server(config, creator, queries);
        server.start();
        
        spdlog::info("Pokedex service started");
        
        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        spdlog::info("Stopping services...");
        server.stop();
        
        spdlog::info("Shutdown complete");
        curl_global_cleanup();
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        curl_global_cleanup();
        return 1;
    }
}
