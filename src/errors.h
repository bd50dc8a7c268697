#pragma once

#include <string>
#include <chrono>
#include <stdexcept>

namespace gradebox {

// Request rejected before any code ran (HTTP 400)
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// No execution slot within the queue bounds (HTTP 503, retryable)
class ServerBusyError : public std::runtime_error {
public:
    ServerBusyError(const std::string& message, std::chrono::seconds retry_after)
        : std::runtime_error(message), retry_after_(retry_after) {}

    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    std::chrono::seconds retry_after_;
};

} // namespace gradebox
