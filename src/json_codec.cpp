#include "json_codec.h"
#include "errors.h"
#include "submission_store.h"

#include <cmath>
#include <memory>

namespace gradebox {

namespace {

// Round to two decimals so timings and memory read cleanly on the wire
double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string optional_string(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (value.isNull()) return "";
    if (value.isString()) return value.asString();
    if (value.isIntegral() && !value.isBool()) return value.asString();
    throw ValidationError(std::string(key) + " must be a string");
}

void optional_number(const Json::Value& root, const char* key, bool& present, double& out) {
    const Json::Value& value = root[key];
    present = false;
    if (value.isNull()) return;
    if (value.isBool() || !value.isNumeric()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    present = true;
    out = value.asDouble();
}

Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

} // namespace

RequestDraft JsonCodec::parse_request(const std::string& body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw ValidationError("malformed JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ValidationError("request body must be a JSON object");
    }

    RequestDraft draft;

    // The mobile client submits under student_code / submitted_code
    const char* code_keys[] = {"code", "student_code", "submitted_code"};
    bool has_code = false;
    for (const char* key : code_keys) {
        const Json::Value& value = root[key];
        if (value.isNull()) continue;
        if (!value.isString()) {
            throw ValidationError(std::string(key) + " must be a string");
        }
        draft.code = value.asString();
        has_code = true;
        break;
    }
    if (!has_code) {
        throw ValidationError("code is required");
    }

    draft.lesson_id = optional_string(root, "lesson_id");
    draft.student_id = optional_string(root, "student_id");

    const Json::Value& test_cases = root["test_cases"];
    if (test_cases.isNull()) {
        throw ValidationError("test_cases is required");
    }
    if (!test_cases.isArray()) {
        throw ValidationError("test_cases must be an array");
    }
    for (Json::ArrayIndex i = 0; i < test_cases.size(); ++i) {
        const Json::Value& item = test_cases[i];
        std::string where = "test_cases[" + std::to_string(i) + "]";
        if (!item.isObject()) {
            throw ValidationError(where + " must be an object");
        }

        TestCase test_case;
        const Json::Value& input = item["input"];
        if (!input.isNull()) {
            if (!input.isString()) {
                throw ValidationError(where + ".input must be a string");
            }
            test_case.input = input.asString();
        }

        const Json::Value& expected = item["expected_output"];
        if (!expected.isString()) {
            throw ValidationError(where + ".expected_output must be a string");
        }
        test_case.expected_output = expected.asString();
        draft.test_cases.push_back(test_case);
    }

    optional_number(root, "timeout_seconds", draft.has_timeout, draft.timeout_seconds);
    optional_number(root, "memory_limit_mb", draft.has_memory_limit, draft.memory_limit_mb);

    return draft;
}

Json::Value JsonCodec::to_json(const TestResult& result) {
    Json::Value json;
    json["test_id"] = result.test_id;
    json["passed"] = result.passed;
    if (!result.input_data.empty()) {
        json["input_data"] = result.input_data;
    }
    json["expected_output"] = result.expected_output;
    if (!result.actual_output.empty()) {
        json["actual_output"] = result.actual_output;
    }
    json["execution_time_ms"] = round2(result.execution_time_ms);
    if (!result.error_message.empty()) {
        json["error_message"] = result.error_message;
    }
    return json;
}

Json::Value JsonCodec::to_json(const ExecutionResponse& response) {
    Json::Value json;
    json["success"] = response.success;
    json["total_tests"] = response.total_tests;
    json["passed_tests"] = response.passed_tests;

    Json::Value results(Json::arrayValue);
    for (const auto& result : response.test_results) {
        results.append(to_json(result));
    }
    json["test_results"] = results;

    if (response.has_overall_output) {
        json["overall_output"] = response.overall_output;
    }
    json["syntax_errors"] = string_array(response.syntax_errors);
    json["runtime_errors"] = string_array(response.runtime_errors);
    json["execution_time_total_ms"] = round2(response.execution_time_total_ms);
    if (response.memory_measured) {
        json["memory_used_mb"] = round2(response.memory_used_mb);
    }
    json["hints_triggered"] = string_array(response.hints_triggered);

    if (response.cancelled) {
        json["cancelled"] = true;
        json["cancel_reason"] = response.cancel_reason;
    }
    return json;
}

Json::Value JsonCodec::to_json(const SubmissionRecord& record, const ExecutionResponse& response) {
    Json::Value json;
    json["submission_id"] = record.submission_id;
    json["score"] = record.score;
    json["passed_tests"] = record.passed_tests;
    json["total_tests"] = record.total_tests;
    json["success"] = record.success;
    json["submitted_at"] = format_timestamp(record.submitted_at);
    json["execution_result"] = to_json(response);
    return json;
}

std::string JsonCodec::write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string JsonCodec::error_body(const std::string& message) {
    Json::Value json;
    json["error"] = message;
    return write(json);
}

} // namespace gradebox
