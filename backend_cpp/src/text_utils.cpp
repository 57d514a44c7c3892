#include "text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace chatty {

std::string trim(const std::string& str) {
    const char* ws = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

}
