#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <memory>

#include "SeatConfig.hpp"
#include "ServerConfig.hpp"
#include "llm_backend.hpp"
#include "time_awareness.hpp"
#include "synth/SynthOrchestrator.hpp"
#include "synth/SynthService.hpp"

using grpc::Server;
using grpc::ServerBuilder;

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    chatty::ServerConfig config = chatty::ServerConfig::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto backend = std::make_shared<chatty::OllamaBackend>(config.backend_endpoint());
    auto seats = std::make_shared<chatty::SeatConfigLoader>(config.models_path);
    auto orchestrator = std::make_shared<chatty::SynthOrchestrator>(
        backend,
        seats,
        std::make_shared<chatty::SystemTimeAwareness>(),
        std::make_shared<chatty::SpdlogEventSink>());

    chatty::SynthServiceImpl service(orchestrator);

    ServerBuilder builder;
    builder.AddListeningPort(config.grpc_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("❌ Could not bind gRPC listener on {}", config.grpc_address);
        return 1;
    }

    spdlog::info("🚀 Synth gRPC Service ignited on {}", config.grpc_address);
    server->Wait();
    return 0;
}
