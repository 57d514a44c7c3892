#include <catch2/catch.hpp>
#include <fstream>
#include "ScopedEnv.hpp"
#include "ServerConfig.hpp"

using namespace chatty;
using chatty::testing::ScopedEnv;

TEST_CASE("Server configuration defaults", "[ServerConfig]") {
    ServerConfig cfg;
    REQUIRE(cfg.host == "127.0.0.1");
    REQUIRE(cfg.port == 5060);
    REQUIRE(cfg.ollama_port == 11434);
    REQUIRE(cfg.timeout_ms == 30000);
    REQUIRE(cfg.models_path == "models.json");
    REQUIRE(cfg.max_body_bytes == 2u * 1024 * 1024);

    auto ep = cfg.backend_endpoint();
    REQUIRE(ep.host == "http://localhost");
    REQUIRE(ep.port == 11434);
    REQUIRE(ep.timeout.count() == 30000);
}

TEST_CASE("Partial JSON keeps the remaining defaults", "[ServerConfig]") {
    auto cfg = ServerConfig::from_json({{"port", 6000}, {"ollama_host", "http://gpu-box"}, {"timeout_ms", 5000}});
    REQUIRE(cfg.port == 6000);
    REQUIRE(cfg.ollama_host == "http://gpu-box");
    REQUIRE(cfg.timeout_ms == 5000);
    REQUIRE(cfg.host == "127.0.0.1");
    REQUIRE(cfg.log_level == "info");

    REQUIRE(ServerConfig::from_json(nlohmann::json::array()).port == 5060);
    REQUIRE(ServerConfig::from_json({{"max_body_bytes", 4096}}).max_body_bytes == 4096u);
}

TEST_CASE("Loading chatty.json from the search path", "[ServerConfig]") {
    std::string dir = CHATTY_TEST_DATA_DIR;
    {
        std::ofstream out(dir + "/chatty.json", std::ios::trunc);
        out << R"({"port": 7070, "models_path": "conf/models.json"})";
    }

    SECTION("First readable file wins") {
        auto cfg = ServerConfig::load({dir + "/missing.json", dir + "/chatty.json"});
        REQUIRE(cfg.models_path == "conf/models.json");
    }

    SECTION("Environment overrides the file") {
        ScopedEnv port("CHATTY_PORT", "8181");
        ScopedEnv timeout("OLLAMA_TIMEOUT_MS", "1500");
        auto cfg = ServerConfig::load({dir + "/chatty.json"});
        REQUIRE(cfg.port == 8181);
        REQUIRE(cfg.timeout_ms == 1500);
        REQUIRE(cfg.backend_endpoint().timeout.count() == 1500);
    }

    SECTION("Non-numeric overrides are ignored") {
        ScopedEnv port("CHATTY_PORT", "not-a-port");
        auto cfg = ServerConfig::load({dir + "/chatty.json"});
        REQUIRE(cfg.port == 7070);
    }

    SECTION("Nothing found means defaults") {
        ScopedEnv port("CHATTY_PORT", "5060");
        auto cfg = ServerConfig::load({dir + "/nope.json"});
        REQUIRE(cfg.port == 5060);
        REQUIRE(cfg.models_path == "models.json");
    }
}
