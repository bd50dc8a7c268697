#pragma once

#include <string>
#include <memory>
#include <chrono>

#include "errors.h"
#include "sandbox.h"
#include "cancellation.h"
#include "execution_pool.h"
#include "execution_types.h"
#include "test_harness.h"
#include "hint_analyzer.h"

namespace gradebox {

struct GatewayOptions {
    HarnessOptions harness;
    size_t max_test_cases = MAX_TEST_CASES;
    size_t max_code_bytes = MAX_CODE_SIZE;
    int max_timeout_seconds = MAX_TIMEOUT_SECONDS;
    size_t min_memory_limit_mb = MIN_MEMORY_LIMIT_MB;
    size_t max_memory_limit_mb = MAX_MEMORY_LIMIT_MB;
};

// Boundary between the wire and the grading pipeline. Validates and clamps
// requests, holds a pool slot for the duration of a run and assembles the
// response.
class Gateway {
public:
    Gateway(CodeRunner& runner, ExecutionPool& pool, const GatewayOptions& options = GatewayOptions{});

    // Throws ValidationError
    ExecutionRequest validate(const RequestDraft& draft) const;

    // Throws ServerBusyError when no slot frees up in time. Every other
    // failure comes back as a response with success=false.
    ExecutionResponse execute(const ExecutionRequest& request,
                              std::shared_ptr<CancellationToken> cancel = nullptr);

    // Outer bound on one request's total sandbox time
    static std::chrono::seconds request_ceiling(const ExecutionRequest& request);

    const GatewayOptions& options() const { return options_; }

private:
    CodeRunner& runner_;
    ExecutionPool& pool_;
    GatewayOptions options_;
    HintAnalyzer hints_;
};

} // namespace gradebox
