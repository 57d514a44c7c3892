#include "SeatConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "synth/SynthErrors.hpp"

namespace chatty {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kDefaultSmalltalkModel = "phi3:latest";

std::string env_override_for_seat(const std::string& seat) {
    std::string key = "OLLAMA_MODEL_" + seat;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

}

std::string SeatTable::model_for(const std::string& seat) const {
    auto it = seats_.find(seat);
    if (it != seats_.end() && !it->second.tag.empty()) return it->second.tag;
    auto fallback = seats_.find("smalltalk");
    if (fallback != seats_.end() && !fallback->second.tag.empty()) return fallback->second.tag;
    return kDefaultSmalltalkModel;
}

std::optional<std::string> SeatTable::role_for(const std::string& seat) const {
    auto it = seats_.find(seat);
    if (it == seats_.end() || it->second.role.empty()) return std::nullopt;
    return it->second.role;
}

std::string SeatTable::synthesis_model() const {
    auto it = seats_.find("synth");
    if (it != seats_.end() && !it->second.tag.empty()) return it->second.tag;
    return model_for("smalltalk");
}

json SeatTable::to_json() const {
    json out = json::object();
    for (const auto& [seat, model] : seats_) {
        out[seat] = model.tag;
    }
    return out;
}

SeatTable SeatConfigLoader::defaults() {
    return SeatTable({
        {"smalltalk", {kDefaultSmalltalkModel, ""}},
        {"coding", {"deepseek-coder-v2", ""}},
        {"creative", {"mistral:instruct", ""}},
    });
}

SeatTable SeatConfigLoader::parse(const json& doc) {
    if (!doc.is_object()) {
        throw SeatConfigError("Seat configuration must be a JSON object");
    }

    std::map<std::string, SeatModel> seats = defaults().seats();
    for (const auto& [seat, info] : doc.items()) {
        if (info.is_string()) {
            seats[seat] = {info.get<std::string>(), ""};
        } else if (info.is_object() && info.contains("tag") && info["tag"].is_string()) {
            std::string role = (info.contains("role") && info["role"].is_string())
                ? info["role"].get<std::string>() : "";
            seats[seat] = {info["tag"].get<std::string>(), role};
        } else {
            throw SeatConfigError("Invalid model entry for seat '" + seat + "'");
        }
    }
    return SeatTable(std::move(seats));
}

SeatTable SeatConfigLoader::load() const {
    SeatTable table = defaults();

    if (!path_.empty() && fs::exists(path_)) {
        std::ifstream f(path_);
        if (!f.is_open()) {
            throw SeatConfigError("Cannot open seat configuration: " + path_);
        }
        try {
            table = parse(json::parse(f));
        } catch (const json::exception& e) {
            spdlog::error("💥 Failed to parse seat configuration {}: {}", path_, e.what());
            throw SeatConfigError("Malformed seat configuration " + path_ + ": " + e.what());
        }
    }

    std::map<std::string, SeatModel> seats = table.seats();
    for (auto& [seat, model] : seats) {
        std::string override_tag = env_override_for_seat(seat);
        if (!override_tag.empty()) model.tag = override_tag;
    }
    // A synth override may exist without a file entry.
    std::string synth_override = env_override_for_seat("synth");
    if (!synth_override.empty()) seats["synth"] = {synth_override, ""};

    return SeatTable(std::move(seats));
}

}
