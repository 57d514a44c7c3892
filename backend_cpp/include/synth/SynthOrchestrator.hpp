#pragma once
#include <memory>
#include <string>
#include "SeatConfig.hpp"
#include "llm_backend.hpp"
#include "synth/HelperDispatcher.hpp"
#include "synth/SynthEvents.hpp"
#include "synth/SynthTypes.hpp"
#include "synth/Synthesizer.hpp"
#include "time_awareness.hpp"

namespace chatty {

/**
 * Turns one user utterance into one reply.
 *
 * For the "synth" seat: validate, classify the tone, assemble time and UI
 * context, fan out to the helper seats, wait for all of them, then issue a
 * single synthesis call. Any other seat is answered by one direct call to
 * that seat's model.
 *
 * Failures surface as SynthError subclasses; individual helper failures never
 * do. Every phase change is reported to the event sink.
 */
class SynthOrchestrator {
public:
    SynthOrchestrator(
        std::shared_ptr<ILlmBackend> backend,
        std::shared_ptr<SeatConfigLoader> seat_config,
        std::shared_ptr<ITimeAwareness> time_awareness,
        std::shared_ptr<ISynthEventSink> default_sink
    );

    SynthResponse run(const SynthRequest& req);
    SynthResponse run(const SynthRequest& req, ISynthEventSink& events);

private:
    std::shared_ptr<ILlmBackend> backend_;
    std::shared_ptr<SeatConfigLoader> seat_config_;
    std::shared_ptr<ITimeAwareness> time_awareness_;
    std::shared_ptr<ISynthEventSink> default_sink_;
    HelperDispatcher dispatcher_;
    Synthesizer synthesizer_;

    SynthResponse run_synth(const SynthRequest& req, const SeatTable& seats, ISynthEventSink& events);
    SynthResponse run_single_seat(const SynthRequest& req, const std::string& seat,
                                  const SeatTable& seats, ISynthEventSink& events);

    void notify(ISynthEventSink& events, SynthPhase phase, const std::string& detail, double duration_ms = 0.0);
};

}
