#pragma once
#include <string>
#include <vector>
#include "synth/SynthTypes.hpp"

namespace chatty {

// Exact short openers ("hi", "good morning", ...). Case and surrounding
// whitespace are ignored.
bool is_greeting(const std::string& text);

/**
 * Casual "how are you" style chatter. Technical vocabulary always wins:
 * anything mentioning bugs, code, builds etc. is never smalltalk.
 */
bool is_smalltalk(const std::string& text);

// A greeting only counts as an opener while the history is still empty.
ToneClass classify(const std::string& prompt, const std::vector<std::string>& history);

const char* tone_name(ToneClass tone);

}
