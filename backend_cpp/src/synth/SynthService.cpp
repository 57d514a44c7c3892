#include "synth/SynthService.hpp"
#include <chrono>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "synth/SynthErrors.hpp"

namespace chatty {

void GrpcStreamSink::emit(const SynthEvent& event) {
    log_.emit(event);

    ::chatty::SynthUpdate update;
    update.set_phase(event.phase);
    update.set_seat(event.seat);
    update.set_payload(event.detail);
    update.set_duration_ms(event.duration_ms);
    write(update);
}

void GrpcStreamSink::write(const ::chatty::SynthUpdate& update) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writer_->Write(update)) {
        spdlog::warn("⚠️ Client stream closed, dropping {} update", update.phase());
    }
}

SynthRequest request_from_proto(const ::chatty::SynthQuery& query) {
    SynthRequest req;
    req.prompt = query.prompt();
    if (!query.seat().empty()) req.seat = query.seat();
    for (const auto& entry : query.history()) {
        req.history.push_back(entry);
    }

    if (!query.ui_context_json().empty()) {
        try {
            req.ui_context = parse_ui_context(nlohmann::ordered_json::parse(query.ui_context_json()));
        } catch (const nlohmann::json::parse_error&) {
            throw ValidationError("Invalid uiContext JSON");
        }
    }

    req.request_context.now = std::chrono::system_clock::now();
    req.request_context.timezone = query.timezone();
    if (query.has_utc_offset() && is_valid_utc_offset(query.utc_offset_minutes())) {
        req.request_context.utc_offset_minutes = query.utc_offset_minutes();
    }
    return req;
}

::grpc::Status status_for(const SynthError& error) {
    switch (error.http_status()) {
        case 400: return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, error.what());
        case 502: return ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, error.what());
        default:  return ::grpc::Status(::grpc::StatusCode::INTERNAL, error.what());
    }
}

::grpc::Status SynthServiceImpl::Synthesize(::grpc::ServerContext* context,
                                            const ::chatty::SynthQuery* request,
                                            ::grpc::ServerWriter<::chatty::SynthUpdate>* writer) {
    GrpcStreamSink sink(writer);
    ::chatty::SynthUpdate closing;

    try {
        SynthRequest req = request_from_proto(*request);
        SynthResponse response = orchestrator_->run(req, sink);

        closing.set_phase("FINAL");
        closing.set_payload(response.answer);
        closing.set_model(response.model);
        closing.set_helpers(response.helper_count);
        sink.write(closing);
        return ::grpc::Status::OK;
    } catch (const SynthError& e) {
        closing.set_phase("ERROR");
        closing.set_payload(e.what());
        sink.write(closing);
        return status_for(e);
    } catch (const std::exception& e) {
        spdlog::error("❌ Synthesize failed: {}", e.what());
        closing.set_phase("ERROR");
        closing.set_payload(e.what());
        sink.write(closing);
        return ::grpc::Status(::grpc::StatusCode::INTERNAL, e.what());
    }
}

}
