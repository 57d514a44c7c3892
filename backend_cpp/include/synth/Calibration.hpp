#pragma once
#include <map>
#include <string>

namespace chatty {

// Seat name -> instruction block that replaces the backend's default tone
// and safety normalization. The user prompt is appended after the block.
const std::map<std::string, std::string>& calibration_table();

// Seats without a table entry get the prompt back unchanged.
std::string apply_calibration(const std::string& seat, const std::string& user_prompt);

}
