#pragma once

#include <string>
#include <deque>
#include <map>
#include <mutex>
#include <chrono>

#include "execution_types.h"

namespace gradebox {

struct SubmissionRecord {
    std::string submission_id;
    std::string student_id;
    std::string lesson_id;
    int score = 0;                 // 0..100
    int passed_tests = 0;
    int total_tests = 0;
    bool success = false;
    std::chrono::system_clock::time_point submitted_at;
};

// Bounded in-memory record of graded submissions; the oldest is evicted first
class SubmissionStore {
public:
    explicit SubmissionStore(size_t capacity = MAX_STORED_SUBMISSIONS);

    // Records a graded response. Cancelled responses are never stored and
    // return false. Throws std::runtime_error when no id can be generated.
    bool record(const std::string& student_id, const std::string& lesson_id,
                const ExecutionResponse& response, SubmissionRecord& out);

    bool find(const std::string& submission_id, SubmissionRecord& out) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

    // round(100 * passed / total), 0 when there are no tests
    static int score(int passed_tests, int total_tests);

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_;
    std::map<std::string, SubmissionRecord> records_;
};

std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace gradebox
