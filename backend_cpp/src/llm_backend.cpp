#include "llm_backend.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"
#include "text_utils.hpp"

namespace chatty {

using json = nlohmann::json;

OllamaBackend::OllamaBackend(BackendEndpoint endpoint) : endpoint_(std::move(endpoint)) {
    while (!endpoint_.host.empty() && endpoint_.host.back() == '/') endpoint_.host.pop_back();
}

std::string OllamaBackend::get_endpoint_url(const std::string& action) const {
    return endpoint_.host + ":" + std::to_string(endpoint_.port) + "/api/" + action;
}

std::string OllamaBackend::generate(const std::string& model, const std::string& prompt) {
    json payload = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", 0.7},
            {"top_p", 0.9},
            {"max_tokens", 2000}
        }}
    };

    auto start = std::chrono::high_resolution_clock::now();

    cpr::Response r = cpr::Post(cpr::Url{get_endpoint_url("generate")},
                                cpr::Body{payload.dump(-1, ' ', false, json::error_handler_t::replace)},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Timeout{endpoint_.timeout});

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_llm_generation_ms.store(duration);

    if (r.error.code != cpr::ErrorCode::OK) {
        SystemMonitor::global_backend_failures.fetch_add(1);
        if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw BackendError("Request timeout after " + std::to_string(endpoint_.timeout.count()) + "ms");
        }
        throw BackendError("Ollama transport error: " + r.error.message);
    }

    if (r.status_code != 200) {
        SystemMonitor::global_backend_failures.fetch_add(1);
        spdlog::error("❌ Ollama API Error [{}] for {}: {}", r.status_code, model, utf8_safe_substr(r.text, 200));
        throw BackendError("Ollama error " + std::to_string(r.status_code) + ": " + r.text);
    }

    try {
        auto response_json = json::parse(r.text);
        if (!response_json.contains("response") || response_json["response"].is_null()) return "";
        return response_json["response"].get<std::string>();
    } catch (const json::exception& e) {
        SystemMonitor::global_backend_failures.fetch_add(1);
        throw BackendError(std::string("Failed to parse response: ") + e.what());
    }
}

}
