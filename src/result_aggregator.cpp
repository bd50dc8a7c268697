#include "result_aggregator.h"

namespace gradebox {

ExecutionResponse ResultAggregator::aggregate(const HarnessReport& report,
                                              int total_tests,
                                              const std::vector<std::string>& hints) {
    ExecutionResponse response;
    response.total_tests = total_tests;
    response.test_results = report.results;
    response.syntax_errors = report.syntax_errors;
    response.runtime_errors = report.runtime_errors;
    response.hints_triggered = hints;
    response.cancelled = report.cancelled;
    response.cancel_reason = report.cancel_reason;
    response.execution_time_total_ms = static_cast<double>(report.total_time.count());

    for (const auto& result : report.results) {
        if (result.passed) {
            ++response.passed_tests;
        }
    }

    response.success = response.passed_tests == total_tests &&
                       report.syntax_errors.empty() &&
                       !report.launch_failed &&
                       !report.cancelled;

    // Per-test output is authoritative; the empty overall output only marks
    // a short-circuited request so callers fall back to syntax_errors
    if (report.results.empty()) {
        response.has_overall_output = true;
        response.overall_output.clear();
    }

    if (report.sandbox_runs > 0) {
        response.memory_measured = true;
        response.memory_used_mb = static_cast<double>(report.peak_memory_kb) / 1024.0;
    }

    return response;
}

} // namespace gradebox
