#pragma once
#include <mutex>
#include <string>
#include <vector>

namespace chatty {

enum class SynthPhase {
    Init,
    Validating,
    Classifying,
    Context,
    Dispatching,
    Aggregating,
    Synthesizing,
    Done,
    Failed
};

const char* phase_name(SynthPhase phase);

// Per-seat helper outcomes are reported with these phase names.
inline const std::string kHelperOkPhase = "HELPER_OK";
inline const std::string kHelperFailedPhase = "HELPER_FAILED";

struct SynthEvent {
    std::string phase;
    std::string seat;
    std::string detail;
    double duration_ms = 0.0;
};

/**
 * Receives orchestration progress. Helper tasks emit concurrently, so
 * implementations must tolerate calls from several threads.
 */
class ISynthEventSink {
public:
    virtual ~ISynthEventSink() = default;
    virtual void emit(const SynthEvent& event) = 0;
};

class SpdlogEventSink : public ISynthEventSink {
public:
    void emit(const SynthEvent& event) override;
};

class NullEventSink : public ISynthEventSink {
public:
    void emit(const SynthEvent&) override {}
};

// Keeps every event in arrival order. Used by the admin view and tests.
class RecordingEventSink : public ISynthEventSink {
public:
    void emit(const SynthEvent& event) override {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.push_back(event);
    }

    std::vector<SynthEvent> events() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_;
    }

    std::vector<std::string> phases() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        out.reserve(events_.size());
        for (const auto& e : events_) out.push_back(e.phase);
        return out;
    }

private:
    mutable std::mutex mtx_;
    std::vector<SynthEvent> events_;
};

}
