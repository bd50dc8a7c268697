#include "execution_pool.h"
#include "constants.h"

#include <iostream>

namespace gradebox {

ExecutionPool::Lease& ExecutionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        reset();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ExecutionPool::Lease::reset() {
    if (pool_) {
        pool_->release();
        pool_ = nullptr;
    }
}

ExecutionPool::ExecutionPool(const Config& config) : config_(config) {
    if (config_.max_concurrent < 1) {
        config_.max_concurrent = 1;
    }
    if (config_.max_queue < 0) {
        config_.max_queue = 0;
    }
}

ExecutionPool::AcquireResult ExecutionPool::acquire(const CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (cancel && cancel->is_cancelled()) {
        return AcquireResult::CANCELLED;
    }

    if (active_ < config_.max_concurrent && queued_ == 0) {
        ++active_;
        return AcquireResult::ACQUIRED;
    }

    if (queued_ >= config_.max_queue) {
        ++rejected_;
        return AcquireResult::QUEUE_FULL;
    }

    ++queued_;
    auto deadline = std::chrono::steady_clock::now() + config_.queue_wait;
    AcquireResult result = AcquireResult::TIMED_OUT;

    while (true) {
        if (cancel && cancel->is_cancelled()) {
            result = AcquireResult::CANCELLED;
            break;
        }
        if (active_ < config_.max_concurrent) {
            ++active_;
            result = AcquireResult::ACQUIRED;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        // Wake periodically to observe cancellation
        auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(POLL_INTERVAL_MS * 5));
        slot_freed_.wait_for(lock, slice);
    }

    --queued_;
    if (result == AcquireResult::TIMED_OUT) {
        ++rejected_;
    }
    if (result != AcquireResult::ACQUIRED && active_ < config_.max_concurrent) {
        // Another waiter may have been passed over while we held the wakeup
        slot_freed_.notify_one();
    }
    return result;
}

void ExecutionPool::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == 0) {
            std::cerr << "[Pool] release() without a matching acquire()" << std::endl;
            return;
        }
        --active_;
        ++completed_;
    }
    slot_freed_.notify_one();
}

ExecutionPool::Stats ExecutionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.capacity = config_.max_concurrent;
    stats.active = active_;
    stats.queued = queued_;
    stats.completed = completed_;
    stats.rejected = rejected_;
    return stats;
}

std::string acquire_result_to_string(ExecutionPool::AcquireResult result) {
    switch (result) {
        case ExecutionPool::AcquireResult::ACQUIRED: return "acquired";
        case ExecutionPool::AcquireResult::QUEUE_FULL: return "queue full";
        case ExecutionPool::AcquireResult::TIMED_OUT: return "queue wait expired";
        case ExecutionPool::AcquireResult::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace gradebox
