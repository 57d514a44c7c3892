#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace chatty {

struct TimeContext {
    std::string local_time;   // "02:05 PM"
    std::string time_of_day;  // "late night", "morning", ...
    std::string day_of_week;
    std::string timezone;
    std::string full_date;    // "Sunday, October 18, 2026"
    int hour = 0;
    int minute = 0;
    bool is_weekend = false;
    bool is_business_hours = false;
    std::string greeting;     // suggested opener for this hour
};

// What the transport knows about the caller's clock.
struct RequestContext {
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    std::optional<int> utc_offset_minutes;  // minutes east of UTC
    std::string timezone;                   // client supplied label
};

class ITimeAwareness {
public:
    virtual ~ITimeAwareness() = default;
    // std::nullopt means "no time information", which is not an error.
    virtual std::optional<TimeContext> resolve(const RequestContext& ctx) = 0;
};

// Local process clock, or the client's UTC offset when one was sent.
class SystemTimeAwareness : public ITimeAwareness {
public:
    std::optional<TimeContext> resolve(const RequestContext& ctx) override;
};

// Real-world offsets run from UTC-12:00 to UTC+14:00.
inline constexpr int kMaxUtcOffsetMinutes = 14 * 60;

bool is_valid_utc_offset(long long minutes);

// X-Timezone-Offset header value -> minutes east of UTC. Trailing garbage and
// out-of-range values yield std::nullopt.
std::optional<int> parse_utc_offset(const std::string& text);

std::string part_of_day(int hour);
std::string greeting_for_hour(int hour);

TimeContext make_time_context(const std::tm& local, const std::string& timezone);

// "Current temporal context:" block for the synthesis prompt.
std::string build_time_prompt_lines(const TimeContext& ctx);

inline const std::string kTimeAwarenessSentence =
    "You are aware of the current time and can reference it naturally in conversation.";

std::string build_greeting_hint(const TimeContext& ctx);

}
