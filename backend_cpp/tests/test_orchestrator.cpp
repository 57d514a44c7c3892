#include <catch2/catch.hpp>
#include <algorithm>
#include <memory>
#include "FakeBackend.hpp"
#include "synth/SynthErrors.hpp"
#include "synth/SynthOrchestrator.hpp"

using namespace chatty;
using namespace chatty::testing;

namespace {

struct Harness {
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    std::shared_ptr<StaticSeatConfig> seats = std::make_shared<StaticSeatConfig>();
    std::optional<TimeContext> time = sunday_at(8, 30);
    RecordingEventSink events;

    SynthOrchestrator make() {
        return SynthOrchestrator(backend, seats,
                                 std::make_shared<FixedTimeAwareness>(time),
                                 std::make_shared<NullEventSink>());
    }
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> pipeline_phases(const RecordingEventSink& sink) {
    std::vector<std::string> out;
    for (const auto& phase : sink.phases()) {
        if (phase != kHelperOkPhase && phase != kHelperFailedPhase) out.push_back(phase);
    }
    return out;
}

SynthRequest request(const std::string& prompt, const std::string& seat = kSynthSeat) {
    SynthRequest req;
    req.prompt = prompt;
    req.seat = seat;
    return req;
}

}

TEST_CASE("Greeting runs the full pipeline", "[SynthOrchestrator]") {
    Harness h;
    h.backend->set_reply("synth-m", {"Good morning! How can I help?"});
    auto orchestrator = h.make();

    auto response = orchestrator.run(request("hi"), h.events);

    REQUIRE(response.answer == "Good morning! How can I help?");
    REQUIRE(response.model == "synth");
    REQUIRE(response.helper_count == 3);
    REQUIRE(response.time.has_value());
    REQUIRE(response.time->time_of_day == "morning");

    auto synth_calls = h.backend->calls_for("synth-m");
    REQUIRE(synth_calls.size() == 1);
    const auto& prompt = synth_calls[0].prompt;
    REQUIRE(ends_with(prompt, "Keep it brief and friendly."));
    REQUIRE(prompt.find("Original question: hi") != std::string::npos);
    REQUIRE(prompt.find("## CODING\nreply from coding-m") != std::string::npos);
    REQUIRE(prompt.find("## SMALLTALK\nreply from smalltalk-m") != std::string::npos);
    REQUIRE(prompt.find("Consider opening with \"Good morning\".") != std::string::npos);
    REQUIRE(h.backend->calls().size() == 4);

    REQUIRE(pipeline_phases(h.events) == std::vector<std::string>{
        "INIT", "VALIDATING", "CLASSIFYING", "CONTEXT", "DISPATCHING",
        "AGGREGATING", "SYNTHESIZING", "DONE"});

    auto all = h.events.phases();
    REQUIRE(std::count(all.begin(), all.end(), kHelperOkPhase) == 3);
}

TEST_CASE("Conversation history changes the closing instruction", "[SynthOrchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    auto req = request("hello");
    req.history = {"hi there"};
    orchestrator.run(req, h.events);

    auto synth_calls = h.backend->calls_for("synth-m");
    REQUIRE(synth_calls.size() == 1);
    REQUIRE(ends_with(synth_calls[0].prompt, "Be comprehensive but not overwhelming."));
    REQUIRE(synth_calls[0].prompt.find("NOTE: Simple greeting detected.") == std::string::npos);
}

TEST_CASE("UI context reaches the synthesis prompt", "[SynthOrchestrator]") {
    Harness h;
    h.time.reset();
    auto orchestrator = h.make();

    auto req = request("how are you feeling today?");
    req.ui_context.route = "/chat";
    req.ui_context.sidebar_collapsed = true;
    auto response = orchestrator.run(req, h.events);

    REQUIRE_FALSE(response.time.has_value());
    const auto& prompt = h.backend->calls_for("synth-m").at(0).prompt;
    REQUIRE(prompt.find("Interface context:\n- Route: /chat\n- Sidebar is collapsed") != std::string::npos);
    REQUIRE(prompt.find("Current temporal context:") == std::string::npos);
    REQUIRE(ends_with(prompt, "Stay brief, warm, and human-like."));
}

TEST_CASE("Validation happens before any backend call", "[SynthOrchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    REQUIRE_THROWS_AS(orchestrator.run(request("   \n"), h.events), ValidationError);
    REQUIRE(h.backend->calls().empty());
    REQUIRE(h.events.phases() == std::vector<std::string>{"INIT", "VALIDATING", "FAILED"});

    try {
        orchestrator.run(request(""));
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(std::string(e.what()) == "Missing prompt");
        REQUIRE(e.http_status() == 400);
    }
}

TEST_CASE("Partial helper failure is invisible to the caller", "[SynthOrchestrator]") {
    Harness h;
    h.backend->fail("coding-m");
    h.backend->set_reply("smalltalk-m", {""});
    h.backend->set_reply("synth-m", {"final"});
    auto orchestrator = h.make();

    auto response = orchestrator.run(request("write a limerick"), h.events);
    REQUIRE(response.answer == "final");
    REQUIRE(response.helper_count == 1);

    const auto& prompt = h.backend->calls_for("synth-m").at(0).prompt;
    REQUIRE(prompt.find("## CREATIVE") != std::string::npos);
    REQUIRE(prompt.find("## CODING") == std::string::npos);
    REQUIRE(prompt.find("## SMALLTALK") == std::string::npos);
}

TEST_CASE("Total helper failure skips synthesis", "[SynthOrchestrator]") {
    Harness h;
    h.backend->fail("coding-m");
    h.backend->fail("creative-m");
    h.backend->fail("smalltalk-m");
    auto orchestrator = h.make();

    REQUIRE_THROWS_AS(orchestrator.run(request("anything"), h.events), AllHelpersFailed);
    REQUIRE(h.backend->calls_for("synth-m").empty());

    auto phases = pipeline_phases(h.events);
    REQUIRE(phases.back() == "FAILED");
    REQUIRE(std::find(phases.begin(), phases.end(), "AGGREGATING") != phases.end());
    REQUIRE(std::find(phases.begin(), phases.end(), "SYNTHESIZING") == phases.end());
}

TEST_CASE("Synthesis failure surfaces the backend message", "[SynthOrchestrator]") {
    Harness h;
    h.backend->fail("synth-m", "model exploded");
    auto orchestrator = h.make();

    try {
        orchestrator.run(request("explain closures"), h.events);
        FAIL("expected SynthesisFailure");
    } catch (const SynthesisFailure& e) {
        REQUIRE(std::string(e.what()) == "model exploded");
    }
    REQUIRE(h.backend->calls().size() == 4);
}

TEST_CASE("Synthesis falls back to the smalltalk model", "[SynthOrchestrator]") {
    Harness h;
    h.seats = std::make_shared<StaticSeatConfig>(SeatTable({
        {"coding", {"coding-m", ""}},
        {"creative", {"creative-m", ""}},
        {"smalltalk", {"smalltalk-m", ""}},
    }));
    auto orchestrator = h.make();

    orchestrator.run(request("tell me something"), h.events);
    REQUIRE(h.backend->calls_for("smalltalk-m").size() == 2);
}

TEST_CASE("Non-synth seats make one direct call", "[SynthOrchestrator]") {
    Harness h;
    h.backend->set_reply("coding-m", {"def f(): pass"});
    auto orchestrator = h.make();

    SECTION("Seat names are case-insensitive") {
        auto response = orchestrator.run(request("stub a function", "  Coding "), h.events);
        REQUIRE(response.answer == "def f(): pass");
        REQUIRE(response.model == "coding");
        REQUIRE(response.helper_count == 0);
        REQUIRE_FALSE(response.time.has_value());

        auto calls = h.backend->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].model == "coding-m");
        REQUIRE(calls[0].prompt.find("User request: stub a function") != std::string::npos);
    }

    SECTION("Unknown seats use the smalltalk model without calibration") {
        auto response = orchestrator.run(request("hello", "poet"), h.events);
        REQUIRE(response.model == "poet");
        auto calls = h.backend->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].model == "smalltalk-m");
        REQUIRE(calls[0].prompt == "hello");
    }

    SECTION("Failure is reported as a seat run failure") {
        h.backend->fail("creative-m", "timed out after 30000 ms");
        try {
            orchestrator.run(request("a haiku", "creative"), h.events);
            FAIL("expected SeatRunFailure");
        } catch (const SeatRunFailure& e) {
            REQUIRE(std::string(e.what()) == "timed out after 30000 ms");
            REQUIRE(e.http_status() == 502);
        }
    }
}

TEST_CASE("Broken seat configuration stops the request early", "[SynthOrchestrator]") {
    Harness h;
    h.seats = std::make_shared<StaticSeatConfig>(test_seats(), true);
    auto orchestrator = h.make();

    REQUIRE_THROWS_AS(orchestrator.run(request("hi"), h.events), SeatConfigError);
    REQUIRE_THROWS_AS(orchestrator.run(request("hi", "coding"), h.events), SeatConfigError);
    REQUIRE(h.backend->calls().empty());
}
