#pragma once
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "synth/UiContext.hpp"
#include "time_awareness.hpp"

namespace chatty {

// Seat name used by clients for the full multi-helper pipeline.
inline const std::string kSynthSeat = "synth";

enum class HelperSeat { Coding, Creative, Smalltalk };

// Declaration order is the order helper output reaches the synthesis prompt.
inline constexpr std::array<HelperSeat, 3> kHelperSeats = {
    HelperSeat::Coding, HelperSeat::Creative, HelperSeat::Smalltalk
};

inline std::string to_string(HelperSeat seat) {
    switch (seat) {
        case HelperSeat::Coding: return "coding";
        case HelperSeat::Creative: return "creative";
        case HelperSeat::Smalltalk: return "smalltalk";
    }
    return "smalltalk";
}

enum class ToneClass { Greeting, Smalltalk, General };

struct HelperResult {
    HelperSeat seat;
    std::string output;
};

struct SynthRequest {
    std::string prompt;
    std::string seat = kSynthSeat;
    std::vector<std::string> history;
    UiContext ui_context;
    RequestContext request_context;
};

struct SynthResponse {
    std::string answer;
    std::string model = kSynthSeat;
    int helper_count = 0;
    std::optional<TimeContext> time;
};

}
