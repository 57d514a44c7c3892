#include "ServerConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace chatty {

using json = nlohmann::json;

namespace {

const char* env(const char* key) {
    const char* value = std::getenv(key);
    return (value && *value) ? value : nullptr;
}

bool parse_int_env(const char* key, long& out) {
    const char* value = env(key);
    if (!value) return false;
    try {
        out = std::stol(value);
        return true;
    } catch (const std::exception&) {
        spdlog::warn("⚠️ Ignoring non-numeric {}={}", key, value);
        return false;
    }
}

}

BackendEndpoint ServerConfig::backend_endpoint() const {
    BackendEndpoint ep;
    ep.host = ollama_host;
    ep.port = ollama_port;
    ep.timeout = std::chrono::milliseconds(timeout_ms);
    return ep;
}

ServerConfig ServerConfig::from_json(const json& doc) {
    ServerConfig cfg;
    if (!doc.is_object()) return cfg;
    cfg.host = doc.value("host", cfg.host);
    cfg.port = doc.value("port", cfg.port);
    cfg.grpc_address = doc.value("grpc_address", cfg.grpc_address);
    cfg.log_level = doc.value("log_level", cfg.log_level);
    cfg.ollama_host = doc.value("ollama_host", cfg.ollama_host);
    cfg.ollama_port = doc.value("ollama_port", cfg.ollama_port);
    cfg.timeout_ms = doc.value("timeout_ms", cfg.timeout_ms);
    cfg.models_path = doc.value("models_path", cfg.models_path);
    cfg.max_body_bytes = doc.value("max_body_bytes", cfg.max_body_bytes);
    return cfg;
}

std::vector<std::string> ServerConfig::default_search_paths() {
    return {
        "chatty.json",            // 1. Current Working Directory
        "../chatty.json",         // 2. Parent Directory (common in build/Release)
        "build/chatty.json",      // 3. Build Directory
        "Release/chatty.json",    // 4. Release Directory
        "../../chatty.json"       // 5. Project Root (from build/Release)
    };
}

ServerConfig ServerConfig::load(const std::vector<std::string>& search_paths) {
    ServerConfig cfg;

    std::ifstream f;
    std::string found_path;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            found_path = path;
            break;
        }
        f.clear();
    }

    if (found_path.empty()) {
        spdlog::info("ℹ️ chatty.json not found, using built-in defaults");
    } else {
        try {
            cfg = from_json(json::parse(f));
            spdlog::info("🛰️ Configuration loaded from {}", found_path);
        } catch (const json::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}. Using defaults.", found_path, e.what());
            cfg = ServerConfig{};
        }
    }

    cfg.apply_env_overrides();
    return cfg;
}

void ServerConfig::apply_env_overrides() {
    long number = 0;
    if (parse_int_env("CHATTY_PORT", number)) port = static_cast<int>(number);
    if (const char* v = env("CHATTY_LOG_LEVEL")) log_level = v;
    if (const char* v = env("CHATTY_MODELS_PATH")) models_path = v;
    if (const char* v = env("OLLAMA_HOST")) ollama_host = v;
    if (parse_int_env("OLLAMA_PORT", number)) ollama_port = static_cast<int>(number);
    if (parse_int_env("OLLAMA_TIMEOUT_MS", number)) timeout_ms = number;
}

}
