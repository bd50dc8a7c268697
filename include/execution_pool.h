#pragma once

#include <string>
#include <mutex>
#include <chrono>
#include <condition_variable>

#include "cancellation.h"

namespace gradebox {

// System-wide bound on simultaneously sandboxed requests, with a bounded
// waiting queue in front of it
class ExecutionPool {
public:
    struct Config {
        int max_concurrent;
        int max_queue;
        std::chrono::seconds queue_wait;

        Config() :
            max_concurrent(4),
            max_queue(32),
            queue_wait(5) {}
    };

    enum class AcquireResult {
        ACQUIRED,
        QUEUE_FULL,      // Too many requests already waiting
        TIMED_OUT,       // Waited queue_wait without a free slot
        CANCELLED        // Caller gave up while queued
    };

    struct Stats {
        int capacity = 0;
        int active = 0;
        int queued = 0;
        long long completed = 0;
        long long rejected = 0;
    };

    // Holds one slot until destroyed
    class Lease {
    public:
        Lease() : pool_(nullptr) {}
        explicit Lease(ExecutionPool* pool) : pool_(pool) {}
        Lease(Lease&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { reset(); }

        bool valid() const { return pool_ != nullptr; }
        void reset();

    private:
        ExecutionPool* pool_;
    };

    explicit ExecutionPool(const Config& config = Config());

    // Blocks until a slot frees up, the wait expires or cancel fires
    AcquireResult acquire(const CancellationToken* cancel = nullptr);

    // Returns a slot taken by a successful acquire()
    void release();

    Stats stats() const;

    const Config& config() const { return config_; }

private:
    Config config_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    int active_ = 0;
    int queued_ = 0;
    long long completed_ = 0;
    long long rejected_ = 0;
};

std::string acquire_result_to_string(ExecutionPool::AcquireResult result);

} // namespace gradebox
