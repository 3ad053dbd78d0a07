#include "tool_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ToolServer::ToolServer(const Config& config,
                       std::shared_ptr<ToolService> tools,
                       std::shared_ptr<EndpointPool> pool,
                       std::shared_ptr<ApiKeyStore> keys)
    : config_(config)
    , tools_(std::move(tools))
    , pool_(std::move(pool))
    , keys_(std::move(keys))
    , server_(std::make_unique<httplib::Server>())
{}

void ToolServer::start() {
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

    spdlog::info("Tool server started");
}

void ToolServer::stop() {
    if (!running_ && !server_thread_.joinable()) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Tool server stopped");
}

void ToolServer::setup_routes() {
    server_->Post(R"(/tools/([a-z_]+))",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_tool(req, res);
        });

    server_->Get("/tools",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_list(req, res);
        });

    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void ToolServer::handle_tool(const httplib::Request& req, httplib::Response& res) {
    std::string tool = req.matches[1];

    try {
        nlohmann::json args = nlohmann::json::object();
        if (!req.body.empty()) {
            args = nlohmann::json::parse(req.body);
        }
        if (!args.is_object()) {
            nlohmann::json reply = {
                {"ok", false},
                {"message", "Error: Request body must be a JSON object"},
                {"ts", util::current_iso8601()}
            };
            res.set_content(reply.dump(), "application/json");
            res.status = 400;
            return;
        }

        spdlog::debug("Tool call: {}", tool);
        auto reply = tools_->dispatch(tool, args);
        res.set_content(reply.dump(), "application/json");
        res.status = 200;

    } catch (const nlohmann::json::parse_error& e) {
        nlohmann::json reply = {
            {"ok", false},
            {"message", std::string("Error: Malformed JSON body: ") + e.what()},
            {"ts", util::current_iso8601()}
        };
        res.set_content(reply.dump(), "application/json");
        res.status = 400;
    } catch (const std::exception& e) {
        spdlog::error("Tool handler error ({}): {}", tool, e.what());
        res.status = 500;
    }
}

void ToolServer::handle_list(const httplib::Request&, httplib::Response& res) {
    nlohmann::json body = {{"tools", ToolService::tool_names()}};
    res.set_content(body.dump(), "application/json");
    res.status = 200;
}

void ToolServer::handle_health(const httplib::Request&, httplib::Response& res) {
    nlohmann::json health = {
        {"ok", true},
        {"service", config_.service_name},
        {"chains", pool_->list().size()},
        {"api_keys", keys_->size()},
        {"encrypted", keys_->encryption_enabled()}
    };

    res.set_content(health.dump(), "application/json");
    res.status = 200;
}
