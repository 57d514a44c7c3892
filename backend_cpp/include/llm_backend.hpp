#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace chatty {

// Transport, timeout and malformed-response failures from a model backend.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class ILlmBackend {
public:
    virtual ~ILlmBackend() = default;
    // Returns the raw completion text. Throws BackendError on failure.
    virtual std::string generate(const std::string& model, const std::string& prompt) = 0;
};

struct BackendEndpoint {
    std::string host = "http://localhost";
    int port = 11434;
    std::chrono::milliseconds timeout{30000};
};

// Ollama /api/generate client. One HTTP request per call, no retries.
class OllamaBackend : public ILlmBackend {
public:
    explicit OllamaBackend(BackendEndpoint endpoint);

    std::string generate(const std::string& model, const std::string& prompt) override;

    const BackendEndpoint& endpoint() const { return endpoint_; }

private:
    BackendEndpoint endpoint_;
    std::string get_endpoint_url(const std::string& action) const;
};

}
