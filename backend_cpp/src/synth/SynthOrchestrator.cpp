#include "synth/SynthOrchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"
#include "synth/Calibration.hpp"
#include "synth/Classifier.hpp"
#include "synth/SynthErrors.hpp"
#include "synth/UiContext.hpp"
#include "text_utils.hpp"

namespace chatty {

SynthOrchestrator::SynthOrchestrator(
    std::shared_ptr<ILlmBackend> backend,
    std::shared_ptr<SeatConfigLoader> seat_config,
    std::shared_ptr<ITimeAwareness> time_awareness,
    std::shared_ptr<ISynthEventSink> default_sink
) : backend_(backend),
    seat_config_(seat_config ? seat_config : std::make_shared<SeatConfigLoader>()),
    time_awareness_(time_awareness),
    default_sink_(default_sink ? default_sink : std::make_shared<SpdlogEventSink>()),
    dispatcher_(backend),
    synthesizer_(backend) {}

void SynthOrchestrator::notify(ISynthEventSink& events, SynthPhase phase,
                               const std::string& detail, double duration_ms) {
    events.emit({phase_name(phase), "", detail, duration_ms});
}

SynthResponse SynthOrchestrator::run(const SynthRequest& req) {
    return run(req, *default_sink_);
}

SynthResponse SynthOrchestrator::run(const SynthRequest& req, ISynthEventSink& events) {
    auto start = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_synth_requests.fetch_add(1);

    try {
        notify(events, SynthPhase::Init, "seat " + req.seat);
        notify(events, SynthPhase::Validating, "prompt length " + std::to_string(req.prompt.size()));
        if (trim(req.prompt).empty()) {
            throw ValidationError("Missing prompt");
        }

        std::string seat = to_lower(trim(req.seat));
        if (seat.empty()) seat = kSynthSeat;

        // Resolved before any backend call so a broken mapping costs nothing.
        SeatTable seats = seat_config_->load();

        SynthResponse response = (seat == kSynthSeat)
            ? run_synth(req, seats, events)
            : run_single_seat(req, seat, seats, events);

        double duration = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
        SystemMonitor::global_synth_request_ms.store(duration);
        notify(events, SynthPhase::Done, "answer length " + std::to_string(response.answer.size()), duration);
        return response;
    } catch (const std::exception& e) {
        double duration = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
        notify(events, SynthPhase::Failed, e.what(), duration);
        throw;
    }
}

SynthResponse SynthOrchestrator::run_synth(const SynthRequest& req, const SeatTable& seats,
                                           ISynthEventSink& events) {
    // Classification and context are pure and never wait on I/O.
    ToneClass tone = classify(req.prompt, req.history);
    notify(events, SynthPhase::Classifying, tone_name(tone));

    std::optional<TimeContext> time;
    if (time_awareness_) time = time_awareness_->resolve(req.request_context);
    std::string ui_block = render_ui_context(req.ui_context);
    notify(events, SynthPhase::Context,
           std::string(time ? time->time_of_day : "no time context") + ", ui lines: "
           + std::to_string(ui_block.empty() ? 0 : std::count(ui_block.begin(), ui_block.end(), '\n') + 1));

    notify(events, SynthPhase::Dispatching, std::to_string(kHelperSeats.size()) + " helper seats");
    auto slots = dispatcher_.dispatch(req.prompt, seats, events);

    notify(events, SynthPhase::Aggregating, std::to_string(slots.size()) + " helper slots settled");
    auto helpers = HelperDispatcher::aggregate(slots);

    SynthesisInput input;
    input.prompt = req.prompt;
    input.tone = tone;
    input.time = time;
    input.ui_block = ui_block;
    input.helpers = helpers;

    const std::string model = seats.synthesis_model();
    notify(events, SynthPhase::Synthesizing, model);

    auto synth_start = std::chrono::high_resolution_clock::now();
    std::string answer = synthesizer_.synthesize(model, build_synthesis_prompt(input));
    double synth_ms = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - synth_start).count();
    spdlog::info("🧠 [Synth][final] ({:.0f} ms) → {}", synth_ms, utf8_safe_substr(answer, 120));

    SynthResponse response;
    response.answer = answer;
    response.model = kSynthSeat;
    response.helper_count = static_cast<int>(helpers.size());
    response.time = time;
    return response;
}

SynthResponse SynthOrchestrator::run_single_seat(const SynthRequest& req, const std::string& seat,
                                                 const SeatTable& seats, ISynthEventSink& events) {
    const std::string model = seats.model_for(seat);
    notify(events, SynthPhase::Dispatching, "single seat " + seat + " via " + model);

    std::string answer;
    try {
        answer = backend_->generate(model, apply_calibration(seat, req.prompt));
    } catch (const std::exception& e) {
        throw SeatRunFailure(e.what());
    }

    SynthResponse response;
    response.answer = answer;
    response.model = seat;
    response.helper_count = 0;
    return response;
}

}
