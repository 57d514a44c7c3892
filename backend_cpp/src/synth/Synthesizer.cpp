#include "synth/Synthesizer.hpp"
#include <cctype>
#include <sstream>
#include "synth/SynthErrors.hpp"

namespace chatty {

namespace {

const char* kFluidConversationHeader =
    "You are Chatty, a fluid conversational AI that naturally synthesizes insights from specialized models.\n\n"
    "FOUNDATIONAL CALIBRATION - FLUID CONVERSATION:\n"
    "- Be naturally conversational, not robotic or overly formal.\n"
    "- Maintain context awareness and conversation flow.\n"
    "- Don't overwhelm with excessive detail unless specifically requested.\n"
    "- Be direct and authentic - skip corporate padding.\n"
    "- Focus on genuine helpfulness over protective disclaimers.";

const char* kGreetingNote =
    "NOTE: Simple greeting detected. Respond naturally and briefly - be friendly without overwhelming detail.";

const char* kSmalltalkNote =
    "NOTE: Casual smalltalk detected. Answer like a person checking in - warm and personal, no technical depth.";

const char* kSynthesisInstruction =
    "Synthesize these insights into a natural, helpful response. Be conversational and maintain context flow. "
    "Don't mention the expert analysis process unless specifically asked about your capabilities.";

const char* closing_line(ToneClass tone) {
    switch (tone) {
        case ToneClass::Greeting: return "Keep it brief and friendly.";
        case ToneClass::Smalltalk: return "Stay brief, warm, and human-like.";
        case ToneClass::General: break;
    }
    return "Be comprehensive but not overwhelming.";
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

}

std::string build_synthesis_prompt(const SynthesisInput& input) {
    std::vector<std::string> sections;

    sections.push_back(kFluidConversationHeader);

    if (input.time) {
        sections.push_back(build_time_prompt_lines(*input.time));
        std::string awareness = kTimeAwarenessSentence;
        if (input.tone == ToneClass::Greeting) {
            std::string hint = build_greeting_hint(*input.time);
            if (!hint.empty()) awareness += "\n" + hint;
        }
        sections.push_back(awareness);
    }

    sections.push_back("Original question: " + input.prompt);

    if (!input.ui_block.empty()) {
        sections.push_back("Interface context:\n" + input.ui_block);
    }

    if (input.tone == ToneClass::Greeting) {
        sections.push_back(kGreetingNote);
    } else if (input.tone == ToneClass::Smalltalk) {
        sections.push_back(kSmalltalkNote);
    }

    std::ostringstream helpers;
    helpers << "Expert insights:";
    for (const auto& helper : input.helpers) {
        helpers << "\n\n## " << upper(to_string(helper.seat)) << "\n" << helper.output;
    }
    sections.push_back(helpers.str());

    sections.push_back(std::string(kSynthesisInstruction) + "\n\n" + closing_line(input.tone));

    std::ostringstream out;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i) out << "\n\n";
        out << sections[i];
    }
    return out.str();
}

std::string Synthesizer::synthesize(const std::string& model, const std::string& composite_prompt) {
    try {
        return backend_->generate(model, composite_prompt);
    } catch (const std::exception& e) {
        throw SynthesisFailure(e.what());
    }
}

}
