#pragma once
#include <memory>
#include <mutex>
#include <grpcpp/grpcpp.h>
#include "synth.grpc.pb.h"
#include "synth/SynthEvents.hpp"
#include "synth/SynthOrchestrator.hpp"

namespace chatty {

// Forwards every event to the client stream and to spdlog. ServerWriter is
// not safe for concurrent writes, so helper tasks are serialized here.
class GrpcStreamSink : public ISynthEventSink {
public:
    explicit GrpcStreamSink(::grpc::ServerWriter<::chatty::SynthUpdate>* writer) : writer_(writer) {}

    void emit(const SynthEvent& event) override;
    void write(const ::chatty::SynthUpdate& update);

private:
    ::grpc::ServerWriter<::chatty::SynthUpdate>* writer_;
    std::mutex write_mutex_;
    SpdlogEventSink log_;
};

SynthRequest request_from_proto(const ::chatty::SynthQuery& query);

// gRPC status for a failure the orchestrator surfaced.
::grpc::Status status_for(const SynthError& error);

class SynthServiceImpl final : public ::chatty::SynthService::Service {
public:
    explicit SynthServiceImpl(std::shared_ptr<SynthOrchestrator> orchestrator)
        : orchestrator_(std::move(orchestrator)) {}

    ::grpc::Status Synthesize(::grpc::ServerContext* context,
                              const ::chatty::SynthQuery* request,
                              ::grpc::ServerWriter<::chatty::SynthUpdate>* writer) override;

private:
    std::shared_ptr<SynthOrchestrator> orchestrator_;
};

}
