#include "api_server.hpp"
#include <spdlog/spdlog.h>

int http_status_for(CreateStatus status) {
    switch (status) {
        case CreateStatus::Created: return 201;
        case CreateStatus::InvalidInput: return 400;
        case CreateStatus::Conflict: return 409;
        case CreateStatus::NotFound: return 404;
        case CreateStatus::Unavailable: return 503;
        case CreateStatus::NoOwnersAvailable: return 503;
    }
    return 500;
}

int http_status_for(QueryStatus status) {
    switch (status) {
        case QueryStatus::Ok: return 200;
        case QueryStatus::InvalidInput: return 400;
        case QueryStatus::NotFound: return 404;
    }
    return 500;
}

ApiServer::ApiServer(const Config& config,
                     CreationService& creator,
                     QueryService& queries)
    : config_(config)
    , creator_(creator)
    , queries_(queries)
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;
    
    setup_routes();
    running_ = true;
    
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });
    
    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (!running_ && !server_thread_.joinable()) return;
    
    running_ = false;
    server_->stop();
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    spdlog::info("API server stopped");
}

void ApiServer::send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void ApiServer::send_query(const QueryResult& result, httplib::Response& res) {
    if (result.status == QueryStatus::Ok) {
        send_json(res, 200, result.names);
        return;
    }
    send_json(res, http_status_for(result.status), {{"detail", result.message}});
}

void ApiServer::setup_routes() {
    server_->Post(R"(/pokemon/create/([^/]*))",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_create(req, res);
        });
    
    server_->Get(R"(/pokemon/ability/([^/]*))",
        [this](const httplib::Request& req, httplib::Response& res) {
            send_query(queries_.pokemon_by_ability(req.matches[1]), res);
        });
    
    server_->Get(R"(/pokemon/type/([^/]*))",
        [this](const httplib::Request& req, httplib::Response& res) {
            send_query(queries_.pokemon_by_type(req.matches[1]), res);
        });
    
    server_->Get(R"(/trainers/pokemon/([^/]*))",
        [this](const httplib::Request& req, httplib::Response& res) {
            send_query(queries_.trainers_by_pokemon(req.matches[1]), res);
        });
    
    server_->Get(R"(/abilities/pokemon/([^/]*))",
        [this](const httplib::Request& req, httplib::Response& res) {
            send_query(queries_.abilities_by_pokemon(req.matches[1]), res);
        });
    
    server_->set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            spdlog::error("{} {} failed: {}", req.method, req.path, what);
            send_json(res, 500, {{"detail", "Internal server error"}});
        });
}

void ApiServer::handle_create(const httplib::Request& req, httplib::Response& res) {
    auto result = creator_.create(req.matches[1]);
    
    if (result.ok()) {
        send_json(res, http_status_for(result.status), {
            {"message", result.message},
            {"pokemon", result.pokemon_name},
            {"trainer", result.trainer_name}
        });
        return;
    }
    
    send_json(res, http_status_for(result.status), {
        {"error", result.status_string()},
        {"detail", result.message}
    });
}
