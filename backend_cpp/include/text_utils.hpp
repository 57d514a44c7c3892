#pragma once
#include <string>

namespace chatty {

std::string trim(const std::string& str);
std::string to_lower(std::string str);

// Cuts at `length` bytes without leaving a partial UTF-8 sequence behind.
std::string utf8_safe_substr(const std::string& str, size_t length);

}
