#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "synth/SynthTypes.hpp"

namespace chatty {

// Request body -> SynthRequest. Missing or mistyped fields take their
// defaults; an absent prompt is left empty for the orchestrator to reject.
SynthRequest request_from_json(const nlohmann::ordered_json& body, const RequestContext& ctx);

nlohmann::json time_to_json(const TimeContext& time);

// {answer, model, metadata:{helpers, time?}}
nlohmann::json response_to_json(const SynthResponse& response);

nlohmann::json error_to_json(const std::string& message);

class SynthOrchestrator;
class ISynthEventSink;

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

/**
 * Full /chatty-sync exchange: parses the raw body, runs the orchestrator and
 * maps the outcome to a status and JSON payload. Never throws for request or
 * pipeline failures; those become {error: ...} replies.
 */
HttpReply handle_synth_body(SynthOrchestrator& orchestrator,
                            const std::string& raw_body,
                            const RequestContext& ctx,
                            ISynthEventSink* events = nullptr);

}
