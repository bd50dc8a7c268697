#include "submission_store.h"
#include "digest.h"

#include <cmath>
#include <ctime>
#include <iostream>

namespace gradebox {

namespace {
constexpr size_t SUBMISSION_ID_BYTES = 16;
}

SubmissionStore::SubmissionStore(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

int SubmissionStore::score(int passed_tests, int total_tests) {
    if (total_tests <= 0) return 0;
    if (passed_tests < 0) passed_tests = 0;
    if (passed_tests > total_tests) passed_tests = total_tests;
    return static_cast<int>(std::lround(100.0 * passed_tests / total_tests));
}

bool SubmissionStore::record(const std::string& student_id, const std::string& lesson_id,
                             const ExecutionResponse& response, SubmissionRecord& out) {
    if (response.cancelled) {
        return false;
    }

    SubmissionRecord record;
    record.submission_id = Digest::random_hex(SUBMISSION_ID_BYTES);
    record.student_id = student_id;
    record.lesson_id = lesson_id;
    record.passed_tests = response.passed_tests;
    record.total_tests = response.total_tests;
    record.score = score(response.passed_tests, response.total_tests);
    record.success = response.success;
    record.submitted_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (order_.size() >= capacity_) {
            records_.erase(order_.front());
            order_.pop_front();
        }
        order_.push_back(record.submission_id);
        records_[record.submission_id] = record;
    }

    std::cout << "[Submissions] " << record.submission_id
              << " student=" << (student_id.empty() ? "-" : student_id)
              << " lesson=" << (lesson_id.empty() ? "-" : lesson_id)
              << " score=" << record.score << std::endl;

    out = record;
    return true;
}

bool SubmissionStore::find(const std::string& submission_id, SubmissionRecord& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(submission_id);
    if (it == records_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

size_t SubmissionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc;
    gmtime_r(&t, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace gradebox
