#include "gateway.h"
#include "digest.h"
#include "result_aggregator.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace gradebox {

namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

ExecutionResponse cancelled_response(const ExecutionRequest& request, const std::string& reason) {
    ExecutionResponse response;
    response.total_tests = static_cast<int>(request.test_cases.size());
    response.cancelled = true;
    response.cancel_reason = reason;
    response.has_overall_output = true;
    return response;
}

} // namespace

Gateway::Gateway(CodeRunner& runner, ExecutionPool& pool, const GatewayOptions& options)
    : runner_(runner), pool_(pool), options_(options), hints_(HintAnalyzer::with_default_rules()) {}

ExecutionRequest Gateway::validate(const RequestDraft& draft) const {
    if (is_blank(draft.code)) {
        throw ValidationError("code must not be empty");
    }
    if (draft.code.size() > options_.max_code_bytes) {
        throw ValidationError("code exceeds " + std::to_string(options_.max_code_bytes) + " bytes");
    }
    if (draft.test_cases.empty()) {
        throw ValidationError("test_cases must not be empty");
    }
    if (draft.test_cases.size() > options_.max_test_cases) {
        throw ValidationError("too many test cases (max " + std::to_string(options_.max_test_cases) + ")");
    }

    ExecutionRequest request;
    request.code = draft.code;
    request.lesson_id = draft.lesson_id;
    request.test_cases = draft.test_cases;

    if (draft.has_timeout) {
        if (!std::isfinite(draft.timeout_seconds) || draft.timeout_seconds <= 0) {
            throw ValidationError("timeout_seconds must be positive");
        }
        double seconds = std::ceil(draft.timeout_seconds);
        if (seconds > options_.max_timeout_seconds) {
            std::cout << "[Gateway] Clamping timeout " << draft.timeout_seconds << "s to "
                      << options_.max_timeout_seconds << "s" << std::endl;
            seconds = options_.max_timeout_seconds;
        }
        request.timeout = std::chrono::seconds(static_cast<long long>(seconds));
    }

    if (draft.has_memory_limit) {
        if (!std::isfinite(draft.memory_limit_mb) || draft.memory_limit_mb <= 0) {
            throw ValidationError("memory_limit_mb must be positive");
        }
        double mb = std::ceil(draft.memory_limit_mb);
        if (mb > static_cast<double>(options_.max_memory_limit_mb)) {
            std::cout << "[Gateway] Clamping memory " << draft.memory_limit_mb << "MB to "
                      << options_.max_memory_limit_mb << "MB" << std::endl;
            mb = static_cast<double>(options_.max_memory_limit_mb);
        } else if (mb < static_cast<double>(options_.min_memory_limit_mb)) {
            std::cout << "[Gateway] Raising memory " << draft.memory_limit_mb << "MB to "
                      << options_.min_memory_limit_mb << "MB" << std::endl;
            mb = static_cast<double>(options_.min_memory_limit_mb);
        }
        request.memory_limit_mb = static_cast<size_t>(mb);
    }

    return request;
}

std::chrono::seconds Gateway::request_ceiling(const ExecutionRequest& request) {
    long long tests = static_cast<long long>(request.test_cases.size());
    long long ceiling = REQUEST_CEILING_FACTOR * request.timeout.count() * tests + REQUEST_CEILING_SLACK_SECONDS;
    return std::chrono::seconds(std::min<long long>(ceiling, MAX_REQUEST_SECONDS));
}

ExecutionResponse Gateway::execute(const ExecutionRequest& request,
                                   std::shared_ptr<CancellationToken> cancel) {
    if (!cancel) {
        cancel = std::make_shared<CancellationToken>();
    }
    cancel->set_deadline(std::chrono::steady_clock::now() + request_ceiling(request));

    std::string fingerprint = Digest::code_fingerprint(request.code);
    std::cout << "[Gateway] Request code=" << fingerprint
              << " lesson=" << (request.lesson_id.empty() ? "-" : request.lesson_id)
              << " tests=" << request.test_cases.size()
              << " timeout=" << request.timeout.count() << "s"
              << " memory=" << request.memory_limit_mb << "MB" << std::endl;

    ExecutionPool::AcquireResult acquired = pool_.acquire(cancel.get());
    switch (acquired) {
        case ExecutionPool::AcquireResult::ACQUIRED:
            break;
        case ExecutionPool::AcquireResult::CANCELLED:
            std::cout << "[Gateway] code=" << fingerprint << " cancelled while queued: "
                      << cancel->reason() << std::endl;
            return cancelled_response(request, cancel->reason());
        case ExecutionPool::AcquireResult::QUEUE_FULL:
        case ExecutionPool::AcquireResult::TIMED_OUT:
            std::cerr << "[Gateway] code=" << fingerprint << " rejected: "
                      << acquire_result_to_string(acquired) << std::endl;
            throw ServerBusyError("server busy", std::chrono::seconds(RETRY_AFTER_SECONDS));
    }
    ExecutionPool::Lease lease(&pool_);

    TestHarness harness(runner_, options_.harness);
    HarnessReport report = harness.run(request, cancel.get());
    lease.reset();

    std::vector<std::string> hints = hints_.analyze(request.code, request.test_cases);
    ExecutionResponse response = ResultAggregator::aggregate(
        report, static_cast<int>(request.test_cases.size()), hints);

    std::cout << "[Gateway] Done code=" << fingerprint
              << " passed=" << response.passed_tests << "/" << response.total_tests
              << " success=" << (response.success ? "true" : "false")
              << " runs=" << report.sandbox_runs
              << " time=" << response.execution_time_total_ms << "ms";
    if (response.cancelled) {
        std::cout << " cancelled=\"" << response.cancel_reason << "\"";
    }
    std::cout << std::endl;

    return response;
}

} // namespace gradebox
