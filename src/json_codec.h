#pragma once

#include <string>
#include <json/json.h>

#include "execution_types.h"

namespace gradebox {

struct SubmissionRecord;

// Wire format of the grading API
class JsonCodec {
public:
    // Decodes an /execute-code or /submit-code body.
    // Throws ValidationError on malformed JSON or mistyped fields.
    static RequestDraft parse_request(const std::string& body);

    static Json::Value to_json(const TestResult& result);
    static Json::Value to_json(const ExecutionResponse& response);
    static Json::Value to_json(const SubmissionRecord& record, const ExecutionResponse& response);

    // Compact single-line serialization
    static std::string write(const Json::Value& value);

    static std::string error_body(const std::string& message);
};

} // namespace gradebox
