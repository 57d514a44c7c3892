#include "synth/SynthEvents.hpp"
#include <spdlog/spdlog.h>

namespace chatty {

const char* phase_name(SynthPhase phase) {
    switch (phase) {
        case SynthPhase::Init: return "INIT";
        case SynthPhase::Validating: return "VALIDATING";
        case SynthPhase::Classifying: return "CLASSIFYING";
        case SynthPhase::Context: return "CONTEXT";
        case SynthPhase::Dispatching: return "DISPATCHING";
        case SynthPhase::Aggregating: return "AGGREGATING";
        case SynthPhase::Synthesizing: return "SYNTHESIZING";
        case SynthPhase::Done: return "DONE";
        case SynthPhase::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

void SpdlogEventSink::emit(const SynthEvent& event) {
    if (event.phase == kHelperFailedPhase) {
        spdlog::warn("⚠️ [Synth][{}] failed after {:.1f} ms: {}", event.seat, event.duration_ms, event.detail);
        return;
    }
    if (event.phase == phase_name(SynthPhase::Failed)) {
        spdlog::error("❌ [Synth] {}", event.detail);
        return;
    }
    if (event.seat.empty()) {
        spdlog::info("🛰️ [Synth][{}] {}", event.phase, event.detail);
    } else {
        spdlog::info("🛰️ [Synth][{}][{}] {} ({:.1f} ms)", event.phase, event.seat, event.detail, event.duration_ms);
    }
}

}
