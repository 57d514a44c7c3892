#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "llm_backend.hpp"

namespace chatty {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 5060;
    std::string grpc_address = "127.0.0.1:50061";
    std::string log_level = "info";
    std::string ollama_host = "http://localhost";
    int ollama_port = 11434;
    long timeout_ms = 30000;
    std::string models_path = "models.json";
    size_t max_body_bytes = 2 * 1024 * 1024;

    BackendEndpoint backend_endpoint() const;

    // Fields present in `doc` replace the defaults; others are kept.
    static ServerConfig from_json(const nlohmann::json& doc);

    // First chatty.json found on the search path, then environment overrides.
    static ServerConfig load(const std::vector<std::string>& search_paths = default_search_paths());
    static std::vector<std::string> default_search_paths();

    void apply_env_overrides();
};

}
