#pragma once
#include <stdexcept>
#include <string>

namespace chatty {

// Base for every failure the orchestrator surfaces to a caller.
// http_status() is the status the HTTP layer answers with.
class SynthError : public std::runtime_error {
public:
    SynthError(const std::string& message, int http_status)
        : std::runtime_error(message), http_status_(http_status) {}

    int http_status() const noexcept { return http_status_; }

private:
    int http_status_;
};

class ValidationError : public SynthError {
public:
    explicit ValidationError(const std::string& message = "Missing prompt")
        : SynthError(message, 400) {}
};

class AllHelpersFailed : public SynthError {
public:
    AllHelpersFailed() : SynthError("Synth helper failure", 502) {}
};

class SeatRunFailure : public SynthError {
public:
    explicit SeatRunFailure(const std::string& message) : SynthError(message, 502) {}
};

class SynthesisFailure : public SynthError {
public:
    explicit SynthesisFailure(const std::string& message) : SynthError(message, 500) {}
};

class SeatConfigError : public SynthError {
public:
    explicit SeatConfigError(const std::string& message) : SynthError(message, 500) {}
};

}
