#include <catch2/catch.hpp>
#include <chrono>
#include <climits>
#include "FakeBackend.hpp"
#include "time_awareness.hpp"

using namespace chatty;

namespace {
// 2026-10-18T12:00:00Z, a Sunday.
constexpr std::time_t kSundayNoonUtc = 1792324800;
}

TEST_CASE("Part of day and greeting boundaries", "[TimeAwareness]") {
    REQUIRE(part_of_day(0) == "late night");
    REQUIRE(part_of_day(5) == "late night");
    REQUIRE(part_of_day(6) == "morning");
    REQUIRE(part_of_day(11) == "morning");
    REQUIRE(part_of_day(12) == "afternoon");
    REQUIRE(part_of_day(16) == "afternoon");
    REQUIRE(part_of_day(17) == "evening");
    REQUIRE(part_of_day(20) == "evening");
    REQUIRE(part_of_day(21) == "night");
    REQUIRE(part_of_day(23) == "night");

    REQUIRE(greeting_for_hour(3) == "Good morning");
    REQUIRE(greeting_for_hour(12) == "Good afternoon");
    REQUIRE(greeting_for_hour(17) == "Good evening");
}

TEST_CASE("Time context from a broken-down time", "[TimeAwareness]") {
    auto ctx = testing::sunday_at(14, 5);
    REQUIRE(ctx.local_time == "02:05 PM");
    REQUIRE(ctx.time_of_day == "afternoon");
    REQUIRE(ctx.day_of_week == "Sunday");
    REQUIRE(ctx.full_date == "Sunday, October 18, 2026");
    REQUIRE(ctx.timezone == "Europe/Berlin");
    REQUIRE(ctx.is_weekend);
    REQUIRE_FALSE(ctx.is_business_hours);
    REQUIRE(ctx.greeting == "Good afternoon");
}

TEST_CASE("Client offsets shift the clock", "[TimeAwareness]") {
    SystemTimeAwareness awareness;
    RequestContext req;
    req.now = std::chrono::system_clock::from_time_t(kSundayNoonUtc);

    SECTION("Positive offset with a label") {
        req.utc_offset_minutes = 120;
        req.timezone = "Europe/Berlin";
        auto ctx = awareness.resolve(req);
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->hour == 14);
        REQUIRE(ctx->local_time == "02:00 PM");
        REQUIRE(ctx->timezone == "Europe/Berlin");
    }

    SECTION("Negative half-hour offset without a label") {
        req.utc_offset_minutes = -330;
        auto ctx = awareness.resolve(req);
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->hour == 6);
        REQUIRE(ctx->minute == 30);
        REQUIRE(ctx->time_of_day == "morning");
        REQUIRE(ctx->timezone == "UTC-05:30");
    }

    SECTION("Offset can cross midnight") {
        req.utc_offset_minutes = 13 * 60;
        auto ctx = awareness.resolve(req);
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->hour == 1);
        REQUIRE(ctx->day_of_week == "Monday");
        REQUIRE_FALSE(ctx->is_weekend);
        REQUIRE(ctx->timezone == "UTC+13:00");
    }

    SECTION("No offset uses the process clock") {
        auto ctx = awareness.resolve(req);
        REQUIRE(ctx.has_value());
        REQUIRE_FALSE(ctx->local_time.empty());
    }
}

TEST_CASE("Offset header parsing", "[TimeAwareness]") {
    REQUIRE(parse_utc_offset("120") == std::optional<int>(120));
    REQUIRE(parse_utc_offset("-330") == std::optional<int>(-330));
    REQUIRE(parse_utc_offset("840") == std::optional<int>(840));
    REQUIRE(parse_utc_offset("-840") == std::optional<int>(-840));
    REQUIRE(parse_utc_offset(" 60 ") == std::optional<int>(60));

    SECTION("Trailing garbage is rejected") {
        REQUIRE_FALSE(parse_utc_offset("5abc").has_value());
        REQUIRE_FALSE(parse_utc_offset("60 minutes").has_value());
        REQUIRE_FALSE(parse_utc_offset("").has_value());
        REQUIRE_FALSE(parse_utc_offset("abc").has_value());
    }

    SECTION("Out of range offsets are rejected") {
        REQUIRE_FALSE(parse_utc_offset("841").has_value());
        REQUIRE_FALSE(parse_utc_offset("500000").has_value());
        REQUIRE_FALSE(parse_utc_offset("-2147483648").has_value());
        REQUIRE_FALSE(parse_utc_offset("99999999999999999999999").has_value());
    }
}

TEST_CASE("Out of range offsets are treated as absent", "[TimeAwareness]") {
    SystemTimeAwareness awareness;
    RequestContext req;
    req.now = std::chrono::system_clock::from_time_t(kSundayNoonUtc);

    RequestContext local = req;
    auto expected = awareness.resolve(local);
    REQUIRE(expected.has_value());

    for (int offset : {INT_MIN, 500000, -841, 841}) {
        INFO("offset " << offset);
        req.utc_offset_minutes = offset;
        auto ctx = awareness.resolve(req);
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->timezone == expected->timezone);
        REQUIRE(ctx->full_date == expected->full_date);
        REQUIRE(ctx->timezone.find("UTC-") == std::string::npos);
    }
}

TEST_CASE("Time prompt lines", "[TimeAwareness]") {
    auto weekend = build_time_prompt_lines(testing::sunday_at(14, 5));
    REQUIRE(weekend ==
        "Current temporal context:\n"
        "- Date: Sunday, October 18, 2026\n"
        "- Time: 02:05 PM\n"
        "- Time of day: afternoon\n"
        "- Day: Sunday\n"
        "- Timezone: Europe/Berlin\n"
        "- It is the weekend.\n"
        "- Outside local business hours.");

    auto monday = testing::sunday_at(10);
    monday.is_weekend = false;
    monday.is_business_hours = true;
    monday.timezone.clear();
    auto lines = build_time_prompt_lines(monday);
    REQUIRE(lines.find("- Timezone:") == std::string::npos);
    REQUIRE(lines.find("- It is a weekday.") != std::string::npos);
    REQUIRE(lines.find("- During local business hours.") != std::string::npos);

    REQUIRE(build_greeting_hint(testing::sunday_at(8)) == "Consider opening with \"Good morning\".");
    TimeContext empty;
    REQUIRE(build_greeting_hint(empty).empty());
}
