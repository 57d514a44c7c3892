#include "synth/Classifier.hpp"
#include <regex>
#include <sstream>
#include <unordered_set>
#include "text_utils.hpp"

namespace chatty {

namespace {

const std::unordered_set<std::string>& greeting_phrases() {
    static const std::unordered_set<std::string> phrases = {
        "hello", "hi", "hey", "yo", "good morning", "good afternoon", "good evening",
        "what's up", "howdy", "greetings",
        "sup", "wassup"
    };
    return phrases;
}

const std::regex& technical_keywords() {
    static const std::regex re(
        "(bug|error|fix|code|function|api|stack trace|exception|deploy|database|build|script)",
        std::regex::icase);
    return re;
}

const std::vector<std::regex>& smalltalk_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("how (are|r) (you|ya)", std::regex::icase),
        std::regex("how('|\xE2\x80\x99)s it going", std::regex::icase),
        std::regex("what('|\xE2\x80\x99)s up", std::regex::icase),
        std::regex("how are things", std::regex::icase),
        std::regex("how are you feeling", std::regex::icase),
        std::regex("how do you feel", std::regex::icase),
        std::regex("how's your (day|morning|afternoon|evening)", std::regex::icase),
        std::regex("what are you up to", std::regex::icase),
        std::regex("how('|\xE2\x80\x99)s everything", std::regex::icase),
    };
    return patterns;
}

size_t word_count(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) ++count;
    return count;
}

}

bool is_greeting(const std::string& text) {
    return greeting_phrases().count(to_lower(trim(text))) > 0;
}

bool is_smalltalk(const std::string& text) {
    const std::string trimmed = to_lower(trim(text));
    if (trimmed.empty()) return false;

    if (std::regex_search(trimmed, technical_keywords())) {
        return false;
    }

    for (const auto& pattern : smalltalk_patterns()) {
        if (std::regex_search(trimmed, pattern)) return true;
    }

    static const std::regex personal_pronoun("\\b(you|your)\\b");
    static const std::regex sentiment_verb("\\b(feel|doing|feeling|going)\\b");

    return word_count(trimmed) <= 24
        && std::regex_search(trimmed, personal_pronoun)
        && std::regex_search(trimmed, sentiment_verb);
}

ToneClass classify(const std::string& prompt, const std::vector<std::string>& history) {
    bool has_prior_messages = false;
    for (const auto& entry : history) {
        if (!trim(entry).empty()) {
            has_prior_messages = true;
            break;
        }
    }

    if (!has_prior_messages && is_greeting(prompt)) return ToneClass::Greeting;
    if (is_smalltalk(prompt)) return ToneClass::Smalltalk;
    return ToneClass::General;
}

const char* tone_name(ToneClass tone) {
    switch (tone) {
        case ToneClass::Greeting: return "greeting";
        case ToneClass::Smalltalk: return "smalltalk";
        case ToneClass::General: return "general";
    }
    return "general";
}

}
