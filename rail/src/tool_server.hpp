#pragma once

#include "config.hpp"
#include "endpoint_pool.hpp"
#include "api_key_store.hpp"
#include "tools.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class ToolServer {
public:
    ToolServer(const Config& config,
               std::shared_ptr<ToolService> tools,
               std::shared_ptr<EndpointPool> pool,
               std::shared_ptr<ApiKeyStore> keys);

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    const Config& config_;
    std::shared_ptr<ToolService> tools_;
    std::shared_ptr<EndpointPool> pool_;
    std::shared_ptr<ApiKeyStore> keys_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_tool(const httplib::Request& req, httplib::Response& res);
    void handle_list(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
};
