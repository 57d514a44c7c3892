#include "time_awareness.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace chatty {

namespace {

std::string format_tm(const std::tm& tm, const char* fmt) {
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string offset_label(int offset_minutes) {
    char sign = offset_minutes < 0 ? '-' : '+';
    long long abs_minutes = offset_minutes < 0 ? -static_cast<long long>(offset_minutes) : offset_minutes;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "UTC%c%02lld:%02lld", sign, abs_minutes / 60, abs_minutes % 60);
    return buf;
}

}

bool is_valid_utc_offset(long long minutes) {
    return minutes >= -kMaxUtcOffsetMinutes && minutes <= kMaxUtcOffsetMinutes;
}

std::optional<int> parse_utc_offset(const std::string& text) {
    try {
        size_t pos = 0;
        long long minutes = std::stoll(text, &pos);
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos != text.size() || !is_valid_utc_offset(minutes)) return std::nullopt;
        return static_cast<int>(minutes);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string part_of_day(int hour) {
    if (hour < 6) return "late night";
    if (hour < 12) return "morning";
    if (hour < 17) return "afternoon";
    if (hour < 21) return "evening";
    return "night";
}

std::string greeting_for_hour(int hour) {
    if (hour < 12) return "Good morning";
    if (hour < 17) return "Good afternoon";
    return "Good evening";
}

TimeContext make_time_context(const std::tm& local, const std::string& timezone) {
    TimeContext ctx;
    ctx.hour = local.tm_hour;
    ctx.minute = local.tm_min;
    ctx.local_time = format_tm(local, "%I:%M %p");
    ctx.time_of_day = part_of_day(local.tm_hour);
    ctx.day_of_week = format_tm(local, "%A");
    ctx.timezone = timezone;
    ctx.full_date = format_tm(local, "%A, %B ") + std::to_string(local.tm_mday) + ", "
                  + std::to_string(local.tm_year + 1900);
    ctx.is_weekend = local.tm_wday == 0 || local.tm_wday == 6;
    ctx.is_business_hours = !ctx.is_weekend && local.tm_hour >= 9 && local.tm_hour < 17;
    ctx.greeting = greeting_for_hour(local.tm_hour);
    return ctx;
}

std::optional<TimeContext> SystemTimeAwareness::resolve(const RequestContext& ctx) {
    std::time_t t = std::chrono::system_clock::to_time_t(ctx.now);
    std::tm tm{};

    if (ctx.utc_offset_minutes && is_valid_utc_offset(*ctx.utc_offset_minutes)) {
        t += static_cast<std::time_t>(*ctx.utc_offset_minutes) * 60;
        if (gmtime_r(&t, &tm) == nullptr) return std::nullopt;
        std::string label = ctx.timezone.empty() ? offset_label(*ctx.utc_offset_minutes) : ctx.timezone;
        return make_time_context(tm, label);
    }

    if (localtime_r(&t, &tm) == nullptr) return std::nullopt;
    const char* tz_env = std::getenv("TZ");
    std::string label = (tz_env && *tz_env) ? std::string(tz_env) : format_tm(tm, "%Z");
    return make_time_context(tm, label);
}

std::string build_time_prompt_lines(const TimeContext& ctx) {
    std::ostringstream out;
    out << "Current temporal context:\n"
        << "- Date: " << ctx.full_date << "\n"
        << "- Time: " << ctx.local_time << "\n"
        << "- Time of day: " << ctx.time_of_day << "\n";
    if (!ctx.day_of_week.empty()) out << "- Day: " << ctx.day_of_week << "\n";
    if (!ctx.timezone.empty()) out << "- Timezone: " << ctx.timezone << "\n";
    out << (ctx.is_weekend ? "- It is the weekend." : "- It is a weekday.") << "\n"
        << (ctx.is_business_hours ? "- During local business hours." : "- Outside local business hours.");
    return out.str();
}

std::string build_greeting_hint(const TimeContext& ctx) {
    if (ctx.greeting.empty()) return "";
    return "Consider opening with \"" + ctx.greeting + "\".";
}

}
