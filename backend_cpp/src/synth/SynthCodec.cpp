#include "synth/SynthCodec.hpp"
#include <spdlog/spdlog.h>
#include "synth/SynthErrors.hpp"
#include "synth/SynthOrchestrator.hpp"

namespace chatty {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

SynthRequest request_from_json(const ordered_json& body, const RequestContext& ctx) {
    SynthRequest req;
    req.request_context = ctx;
    if (!body.is_object()) return req;

    auto prompt = body.find("prompt");
    if (prompt != body.end() && prompt->is_string()) {
        req.prompt = prompt->get<std::string>();
    }

    auto seat = body.find("seat");
    if (seat != body.end() && seat->is_string() && !seat->get<std::string>().empty()) {
        req.seat = seat->get<std::string>();
    }

    // Plain strings, or {text, timestamp} entries as stored by the web client.
    auto history = body.find("history");
    if (history != body.end() && history->is_array()) {
        for (const auto& entry : *history) {
            if (entry.is_string()) {
                req.history.push_back(entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("text") && entry["text"].is_string()) {
                req.history.push_back(entry["text"].get<std::string>());
            }
        }
    }

    auto ui = body.find("uiContext");
    if (ui != body.end()) {
        req.ui_context = parse_ui_context(*ui);
    }
    return req;
}

json time_to_json(const TimeContext& time) {
    return {
        {"localTime", time.local_time},
        {"timeOfDay", time.time_of_day},
        {"dayOfWeek", time.day_of_week},
        {"timezone", time.timezone}
    };
}

json response_to_json(const SynthResponse& response) {
    json metadata = json::object();
    if (response.model == kSynthSeat) {
        metadata["helpers"] = response.helper_count;
    }
    if (response.time) {
        metadata["time"] = time_to_json(*response.time);
    }
    return {
        {"answer", response.answer},
        {"model", response.model},
        {"metadata", metadata}
    };
}

json error_to_json(const std::string& message) {
    return {{"error", message}};
}

HttpReply handle_synth_body(SynthOrchestrator& orchestrator,
                            const std::string& raw_body,
                            const RequestContext& ctx,
                            ISynthEventSink* events) {
    ordered_json body;
    try {
        body = raw_body.empty() ? ordered_json::object() : ordered_json::parse(raw_body);
    } catch (const json::parse_error& e) {
        spdlog::warn("⚠️ Rejecting malformed request body: {}", e.what());
        return {400, error_to_json("Invalid JSON body")};
    }

    try {
        SynthRequest req = request_from_json(body, ctx);
        SynthResponse response = events ? orchestrator.run(req, *events) : orchestrator.run(req);
        return {200, response_to_json(response)};
    } catch (const SynthError& e) {
        return {e.http_status(), error_to_json(e.what())};
    } catch (const std::exception& e) {
        spdlog::error("❌ Synth request error: {}", e.what());
        return {500, error_to_json(e.what())};
    }
}

}
