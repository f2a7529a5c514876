#pragma once

#include "config.hpp"
#include "creation_service.hpp"
#include "query_service.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <thread>

int http_status_for(CreateStatus status);
int http_status_for(QueryStatus status);

class ApiServer {
public:
    ApiServer(const Config& config,
              CreationService& creator,
              QueryService& queries);
    
    void start();
    void stop();
    bool is_running() const { return running_; }
    
private:
    const Config& config_;
    CreationService& creator_;
    QueryService& queries_;
    
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    
    void setup_routes();
    void handle_create(const httplib::Request& req, httplib::Response& res);
    void send_query(const QueryResult& result, httplib::Response& res);
    void send_json(httplib::Response& res, int status, const nlohmann::json& body);
};
