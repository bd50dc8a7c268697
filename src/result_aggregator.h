#pragma once

#include <string>
#include <vector>

#include "execution_types.h"
#include "test_harness.h"

namespace gradebox {

// Folds a harness report into the wire-level response.
// Pure: no I/O, no clock, no shared state.
class ResultAggregator {
public:
    static ExecutionResponse aggregate(const HarnessReport& report,
                                       int total_tests,
                                       const std::vector<std::string>& hints);
};

} // namespace gradebox
