#pragma once

#include <string>
#include <vector>
#include <chrono>

#include "constants.h"

namespace gradebox {

// One (input, expected output) pair. Identity is the position in the request.
struct TestCase {
    std::string input;             // Fed to stdin; empty means no input
    std::string expected_output;
};

// Request as decoded from the wire, before validation and clamping
struct RequestDraft {
    std::string code;
    std::string lesson_id;
    std::string student_id;        // /submit-code only
    std::vector<TestCase> test_cases;
    bool has_timeout = false;
    double timeout_seconds = 0;
    bool has_memory_limit = false;
    double memory_limit_mb = 0;
};

// Accepted request; not modified once validated
struct ExecutionRequest {
    std::string code;
    std::string lesson_id;         // Logging only
    std::vector<TestCase> test_cases;
    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SECONDS};
    size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
};

struct TestResult {
    int test_id = 0;
    bool passed = false;
    std::string input_data;        // Omitted from JSON when empty
    std::string expected_output;
    std::string actual_output;     // Omitted from JSON when empty
    double execution_time_ms = 0;
    std::string error_message;     // Omitted from JSON when empty
};

struct ExecutionResponse {
    bool success = false;
    int total_tests = 0;
    int passed_tests = 0;
    std::vector<TestResult> test_results;
    bool has_overall_output = false;
    std::string overall_output;
    std::vector<std::string> syntax_errors;
    std::vector<std::string> runtime_errors;
    double execution_time_total_ms = 0;
    bool memory_measured = false;
    double memory_used_mb = 0;
    std::vector<std::string> hints_triggered;

    // Cancelled responses are never graded and may hold fewer results
    bool cancelled = false;
    std::string cancel_reason;
};

} // namespace gradebox
