#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "llm_backend.hpp"
#include "synth/SynthTypes.hpp"
#include "time_awareness.hpp"

namespace chatty {

struct SynthesisInput {
    std::string prompt;
    ToneClass tone = ToneClass::General;
    std::optional<TimeContext> time;
    std::string ui_block;
    std::vector<HelperResult> helpers;
};

// Composite prompt: header, time, question, UI, tone note, helpers, closing.
std::string build_synthesis_prompt(const SynthesisInput& input);

class Synthesizer {
public:
    explicit Synthesizer(std::shared_ptr<ILlmBackend> backend) : backend_(std::move(backend)) {}

    // Exactly one backend call. The output is returned untouched.
    // Throws SynthesisFailure with the backend's message.
    std::string synthesize(const std::string& model, const std::string& composite_prompt);

private:
    std::shared_ptr<ILlmBackend> backend_;
};

}
