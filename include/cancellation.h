#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace gradebox {

// Cooperative cancellation shared between a request and the work it spawns.
// Cancelled either explicitly (client went away) or by passing a deadline.
class CancellationToken {
public:
    CancellationToken() : cancelled_(false), has_deadline_(false) {}

    void cancel(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            reason_ = reason;
            cancelled_ = true;
        }
    }

    void set_deadline(std::chrono::steady_clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = deadline;
        has_deadline_ = true;
    }

    bool is_cancelled() const {
        if (cancelled_) return true;
        std::lock_guard<std::mutex> lock(mutex_);
        return has_deadline_ && std::chrono::steady_clock::now() >= deadline_;
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return reason_;
        if (has_deadline_ && std::chrono::steady_clock::now() >= deadline_) {
            return "request deadline exceeded";
        }
        return "";
    }

private:
    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    std::string reason_;
    bool has_deadline_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace gradebox
