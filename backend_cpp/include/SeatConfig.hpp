#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace chatty {

struct SeatModel {
    std::string tag;   // backend model identifier, e.g. "phi3:latest"
    std::string role;  // optional description from models.json
};

// Read-only seat -> model mapping for one request.
class SeatTable {
public:
    SeatTable() = default;
    explicit SeatTable(std::map<std::string, SeatModel> seats) : seats_(std::move(seats)) {}

    // Unknown seats fall back to the smalltalk model.
    std::string model_for(const std::string& seat) const;
    std::optional<std::string> role_for(const std::string& seat) const;

    // The "synth" entry when configured, otherwise the smalltalk model.
    std::string synthesis_model() const;

    const std::map<std::string, SeatModel>& seats() const { return seats_; }
    nlohmann::json to_json() const;

private:
    std::map<std::string, SeatModel> seats_;
};

/**
 * Loads models.json and applies OLLAMA_MODEL_<SEAT> environment overrides.
 * A missing file yields the built-in defaults; a file that exists but cannot
 * be read or has the wrong shape throws SeatConfigError.
 */
class SeatConfigLoader {
public:
    explicit SeatConfigLoader(std::string path = "models.json") : path_(std::move(path)) {}
    virtual ~SeatConfigLoader() = default;

    virtual SeatTable load() const;

    static SeatTable defaults();
    static SeatTable parse(const nlohmann::json& doc);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}
