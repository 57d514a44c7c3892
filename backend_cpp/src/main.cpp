#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>
#include <ctime>

#include "LogManager.hpp"
#include "SeatConfig.hpp"
#include "ServerConfig.hpp"
#include "SystemMonitor.hpp"
#include "llm_backend.hpp"
#include "text_utils.hpp"
#include "time_awareness.hpp"
#include "synth/SynthCodec.hpp"
#include "synth/SynthOrchestrator.hpp"

using json = nlohmann::json;

namespace {

std::string iso_timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// X-Timezone carries a label, X-Timezone-Offset the minutes east of UTC.
chatty::RequestContext request_context_from(const httplib::Request& req) {
    chatty::RequestContext ctx;
    ctx.now = std::chrono::system_clock::now();
    ctx.timezone = req.get_header_value("X-Timezone");
    std::string offset = req.get_header_value("X-Timezone-Offset");
    if (!offset.empty()) {
        ctx.utc_offset_minutes = chatty::parse_utc_offset(offset);
        if (!ctx.utc_offset_minutes) {
            spdlog::warn("⚠️ Ignoring malformed X-Timezone-Offset '{}'", chatty::utf8_safe_substr(offset, 32));
        }
    }
    return ctx;
}

}

class ChattyServer {
public:
    explicit ChattyServer(chatty::ServerConfig config)
        : config_(std::move(config)),
          server_()
    {
        backend_ = std::make_shared<chatty::OllamaBackend>(config_.backend_endpoint());
        seat_config_ = std::make_shared<chatty::SeatConfigLoader>(config_.models_path);
        orchestrator_ = std::make_shared<chatty::SynthOrchestrator>(
            backend_,
            seat_config_,
            std::make_shared<chatty::SystemTimeAwareness>(),
            std::make_shared<chatty::SpdlogEventSink>());
        server_.set_payload_max_length(config_.max_body_bytes);
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Chatty synth backend listening on http://{}:{}/chatty-sync", config_.host, config_.port);
        spdlog::info("🛰️ Model backend: {}:{} (timeout {} ms)", config_.ollama_host, config_.ollama_port, config_.timeout_ms);
        if (!server_.listen(config_.host.c_str(), config_.port)) {
            spdlog::error("❌ Could not bind {}:{}", config_.host, config_.port);
            return false;
        }
        return true;
    }

private:
    chatty::ServerConfig config_;
    httplib::Server server_;

    std::shared_ptr<chatty::OllamaBackend> backend_;
    std::shared_ptr<chatty::SeatConfigLoader> seat_config_;
    std::shared_ptr<chatty::SynthOrchestrator> orchestrator_;

    chatty::SystemMonitor system_monitor_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Timezone, X-Timezone-Offset");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            json models = json::object();
            try {
                models = seat_config_->load().to_json();
            } catch (const std::exception& e) {
                models = {{"error", e.what()}};
            }
            json response = {
                {"status", "healthy"},
                {"service", "Chatty Synth Backend"},
                {"models", models},
                {"timestamp", iso_timestamp_now()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Post("/chatty-sync", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_chatty_sync(req, res);
        });

        // Replies pushed back by downstream consumers are only recorded.
        server_.Post("/katana-listen", [](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = json::parse(req.body.empty() ? "{}" : req.body);
                json payload = {
                    {"answer", body.value("answer", json())},
                    {"model", body.value("model", json())},
                    {"metadata", body.value("metadata", json())}
                };
                chatty::LogManager::instance().add_traffic("out", payload, iso_timestamp_now());
                std::string model = payload["model"].is_string() ? payload["model"].get<std::string>() : "unknown";
                std::string answer = payload["answer"].is_string() ? payload["answer"].get<std::string>() : payload["answer"].dump();
                spdlog::info("↪ Received reply [{}]: {}", model, chatty::utf8_safe_substr(answer, 120));
                res.set_content(json{{"status", "received"}}.dump(), "application/json");
            } catch (const std::exception& e) {
                res.status = 400;
                res.set_content(chatty::error_to_json(e.what()).dump(), "application/json");
            }
        });

        server_.Get("/last-messages", [](const httplib::Request&, httplib::Response& res) {
            json response = {{"messages", chatty::LogManager::instance().get_traffic_json()}};
            res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            auto metrics = system_monitor_.get_latest_snapshot();
            auto logs = chatty::LogManager::instance().get_logs_json();

            json response = {
                {"metrics", {
                    {"ram_mb", metrics.ram_usage_mb},
                    {"ram_total", metrics.ram_total_mb},
                    {"llm_latency", metrics.llm_generation_ms},
                    {"synth_latency", metrics.synth_request_ms},
                    {"synth_requests", metrics.synth_requests},
                    {"helper_failures", metrics.helper_failures},
                    {"backend_failures", metrics.backend_failures}
                }},
                {"logs", logs}
            };
            res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        });
    }

    void handle_chatty_sync(const httplib::Request& req, httplib::Response& res) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json inbound = json::object();
        try {
            auto body = json::parse(req.body);
            inbound = {{"prompt", body.value("prompt", json())}, {"seat", body.value("seat", json("synth"))}};
        } catch (const std::exception&) {
            inbound = {{"raw", chatty::utf8_safe_substr(req.body, 500)}};
        }
        chatty::LogManager::instance().add_traffic("in", inbound, iso_timestamp_now());

        auto reply = chatty::handle_synth_body(*orchestrator_, req.body, request_context_from(req));

        res.status = reply.status;
        res.set_content(reply.body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        chatty::LogManager::instance().add_traffic("out", reply.body, iso_timestamp_now());

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time).count();

        std::string prompt = inbound.contains("prompt") && inbound["prompt"].is_string()
            ? inbound["prompt"].get<std::string>() : "";
        std::string seat = inbound.contains("seat") && inbound["seat"].is_string()
            ? inbound["seat"].get<std::string>() : "synth";
        std::string answer = reply.body.contains("answer") ? reply.body["answer"].get<std::string>()
                                                           : reply.body.value("error", "");
        int helpers = 0;
        if (reply.body.contains("metadata") && reply.body["metadata"].contains("helpers")) {
            helpers = reply.body["metadata"]["helpers"].get<int>();
        }

        chatty::LogManager::instance().add_log({
            std::time(nullptr), seat, prompt, helpers, answer, reply.status, (double)duration
        });
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    chatty::ServerConfig config = chatty::ServerConfig::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    ChattyServer server(config);
    return server.run() ? 0 : 1;
}
