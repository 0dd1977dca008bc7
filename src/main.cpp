#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <signal.h>

#include "llm_dispatch/DispatchConfig.hpp"
#include "llm_dispatch/DispatchService.hpp"
#include "llm_dispatch/providers/ProviderRegistry.hpp"

using json = nlohmann::json;

httplib::Server* global_server_ptr = nullptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

class DispatchServer {
public:
    explicit DispatchServer(llm_dispatch::DispatchConfig config)
        : host_(config.host), port_(config.port),
          service_(config, llm_dispatch::ProviderRegistry::with_defaults(config)) {
        setup_routes();
        global_server_ptr = &server_;
    }

    ~DispatchServer() { global_server_ptr = nullptr; }

    void run() {
        spdlog::info("🚀 LLM dispatch server listening on {}:{}", host_, port_);
        if (!server_.listen(host_.c_str(), port_)) {
            spdlog::error("💥 Could not bind {}:{}", host_, port_);
        }
    }

private:
    std::string host_;
    int port_;
    httplib::Server server_;
    llm_dispatch::DispatchService service_;

    static void reply_error(httplib::Response& res, int status, const std::string& msg) {
        res.status = status;
        res.set_content(json{{"error", msg}}.dump(), "application/json");
    }

    void handle_dispatch(const httplib::Request& req, httplib::Response& res) {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            reply_error(res, 400, "Invalid JSON encoding");
            return;
        }
        try {
            auto request = llm_dispatch::DispatchService::request_from_json(body);
            auto result = service_.dispatch_one(std::move(request));
            res.set_content(result.to_json().dump(), "application/json");
        } catch (const std::invalid_argument& e) {
            reply_error(res, 400, e.what());
        } catch (const std::exception& e) {
            spdlog::error("💥 /dispatch failed: {}", e.what());
            reply_error(res, 500, "Internal Server Error");
        }
    }

    void handle_batch(const httplib::Request& req, httplib::Response& res) {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("requests") || !body["requests"].is_array()) {
            reply_error(res, 400, "Expected {\"requests\": [...]}");
            return;
        }
        try {
            std::vector<llm_dispatch::CallRequest> requests;
            for (const auto& item : body["requests"]) {
                requests.push_back(llm_dispatch::DispatchService::request_from_json(item));
            }
            size_t limit = body.value("concurrency_limit", size_t{0});
            auto result = service_.dispatch_batch(std::move(requests), limit);
            res.set_content(result.to_json().dump(), "application/json");
        } catch (const llm_dispatch::BatchValidationError& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}, {"submitted", e.submitted_}, {"limit", e.limit_}}.dump(),
                            "application/json");
        } catch (const std::invalid_argument& e) {
            reply_error(res, 400, e.what());
        } catch (const std::exception& e) {
            spdlog::error("💥 /dispatch/batch failed: {}", e.what());
            reply_error(res, 500, "Internal Server Error");
        }
    }

    void setup_routes() {
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            return httplib::Server::HandlerResponse::Unhandled;
        });
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

        server_.Post("/dispatch", [this](const httplib::Request& req, httplib::Response& res) { handle_dispatch(req, res); });
        server_.Post("/dispatch/batch", [this](const httplib::Request& req, httplib::Response& res) { handle_batch(req, res); });

        server_.Get("/api/admin/credentials", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(service_.pool_status().dump(), "application/json");
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            json payload = service_.recent_calls();
            payload["config"] = service_.config().to_json();
            res.set_content(payload.dump(), "application/json");
        });

        server_.Get("/api/hello", [](const httplib::Request&, httplib::Response& res) { res.set_content(R"({"status": "nominal"})", "application/json"); });
    }
};

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        auto config = llm_dispatch::DispatchConfig::from_env();
        if (config.debug) spdlog::set_level(spdlog::level::debug);
        if (config.credentials.empty()) spdlog::warn("⚠️ No API keys configured (env, .env or keys.json)");

        DispatchServer app(std::move(config));
        app.run(); // This blocks
    } catch (const llm_dispatch::ConfigError& e) {
        spdlog::critical("💥 Invalid configuration: {}", e.what());
        return 1;
    }
    return 0;
}
