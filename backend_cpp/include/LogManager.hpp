#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace chatty {

using json = nlohmann::json;

struct InteractionLog {
    long long timestamp;
    std::string seat;
    std::string user_query;
    int helper_count;
    std::string answer;
    int status;
    double duration_ms;
};

// One request or reply crossing the HTTP boundary.
struct TrafficEntry {
    std::string dir;  // "in" | "out"
    json payload;
    std::string ts;   // ISO-8601 UTC
};

class LogManager {
public:
    static constexpr size_t kMaxInteractions = 50;
    static constexpr size_t kMaxTraffic = 100;

    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(InteractionLog log) {
        log.seat = valid_utf8(log.seat);
        log.user_query = valid_utf8(log.user_query);
        log.answer = valid_utf8(log.answer);
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(std::move(log));
        if (logs_.size() > kMaxInteractions) {
            logs_.pop_front();
        }
    }

    void add_traffic(const std::string& dir, const json& payload, const std::string& ts) {
        json clean = valid_utf8(payload);
        std::lock_guard<std::mutex> lock(mtx_);
        traffic_.push_back({dir, std::move(clean), ts});
        if (traffic_.size() > kMaxTraffic) {
            traffic_.pop_front();
        }
    }

    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Return in reverse order (newest first)
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"seat", it->seat},
                {"user_query", it->user_query},
                {"helpers", it->helper_count},
                {"answer", it->answer},
                {"status", it->status},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    // Oldest first, matching the order traffic arrived.
    json get_traffic_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (const auto& entry : traffic_) {
            j_list.push_back({{"dir", entry.dir}, {"payload", entry.payload}, {"ts", entry.ts}});
        }
        return j_list;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
        traffic_.clear();
    }

    // Invalid UTF-8 sequences become U+FFFD so the buffers always serialize.
    static json valid_utf8(const json& value) {
        return json::parse(value.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    static std::string valid_utf8(const std::string& text) {
        return valid_utf8(json(text)).get<std::string>();
    }

private:
    LogManager() {} // Private constructor
    std::deque<InteractionLog> logs_;
    std::deque<TrafficEntry> traffic_;
    std::mutex mtx_;
};

}
