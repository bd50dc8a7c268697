#include "grading_api.h"
#include "json_codec.h"

#include <iostream>

namespace gradebox {

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = JsonCodec::write(body);
    return resp;
}

GradingApi::GradingApi(Gateway& gateway, ExecutionPool& pool, SubmissionStore& submissions, ReadyCheck ready)
    : gateway_(gateway), pool_(pool), submissions_(submissions), ready_(ready) {}

void GradingApi::register_routes(HttpServer& server) {
    server.route("POST", "/execute-code", [this](const HttpRequest& req) { return execute_code(req); });
    server.route("POST", "/submit-code", [this](const HttpRequest& req) { return submit_code(req); });
    server.route("POST", "/generate-new-challenge", [this](const HttpRequest& req) { return generate_challenge(req); });
    server.route("GET", "/health", [this](const HttpRequest& req) { return health(req); });
    server.route("GET", "/stats", [this](const HttpRequest& req) { return stats(req); });
    server.route("GET", "/", [this](const HttpRequest& req) { return info(req); });
}

bool GradingApi::grade(const HttpRequest& req, RequestDraft& draft, ExecutionResponse& response,
                       HttpResponse& resp) {
    try {
        draft = JsonCodec::parse_request(req.body);
        ExecutionRequest request = gateway_.validate(draft);
        response = gateway_.execute(request, req.cancel);
        return true;
    } catch (const ValidationError& e) {
        std::cout << "[Api] " << req.client_ip << " " << req.path << " rejected: " << e.what() << std::endl;
        Json::Value body;
        body["error"] = e.what();
        resp = json_response(400, body);
        return false;
    } catch (const ServerBusyError& e) {
        Json::Value body;
        body["error"] = e.what();
        body["retryable"] = true;
        resp = json_response(503, body);
        resp.headers["Retry-After"] = std::to_string(e.retry_after().count());
        return false;
    }
}

HttpResponse GradingApi::execute_code(const HttpRequest& req) {
    RequestDraft draft;
    ExecutionResponse response;
    HttpResponse resp;
    if (!grade(req, draft, response, resp)) {
        return resp;
    }
    return json_response(200, JsonCodec::to_json(response));
}

HttpResponse GradingApi::submit_code(const HttpRequest& req) {
    RequestDraft draft;
    ExecutionResponse response;
    HttpResponse resp;
    if (!grade(req, draft, response, resp)) {
        return resp;
    }

    SubmissionRecord record;
    if (!submissions_.record(draft.student_id, draft.lesson_id, response, record)) {
        // Cancelled runs are not graded: no score, nothing recorded
        Json::Value body;
        body["cancelled"] = true;
        body["cancel_reason"] = response.cancel_reason;
        body["passed_tests"] = response.passed_tests;
        body["total_tests"] = response.total_tests;
        body["success"] = false;
        body["execution_result"] = JsonCodec::to_json(response);
        return json_response(200, body);
    }
    return json_response(200, JsonCodec::to_json(record, response));
}

HttpResponse GradingApi::generate_challenge(const HttpRequest&) {
    Json::Value body;
    body["error"] = "challenge generation is provided by the content service";
    return json_response(501, body);
}

HttpResponse GradingApi::health(const HttpRequest&) {
    std::string reason;
    bool ready = false;
    try {
        ready = ready_ && ready_(reason);
    } catch (const std::exception& e) {
        reason = e.what();
    }

    Json::Value body;
    if (ready) {
        body["status"] = "healthy";
        body["sandbox"] = "ready";
        return json_response(200, body);
    }
    body["status"] = "unhealthy";
    body["reason"] = reason.empty() ? "sandbox not ready" : reason;
    std::cerr << "[Api] Health check failed: " << body["reason"].asString() << std::endl;
    return json_response(503, body);
}

HttpResponse GradingApi::stats(const HttpRequest&) {
    ExecutionPool::Stats pool = pool_.stats();
    Json::Value body;
    body["pool"]["capacity"] = pool.capacity;
    body["pool"]["active"] = pool.active;
    body["pool"]["queued"] = pool.queued;
    body["pool"]["completed"] = static_cast<Json::Int64>(pool.completed);
    body["pool"]["rejected"] = static_cast<Json::Int64>(pool.rejected);
    body["submissions"]["stored"] = static_cast<Json::UInt64>(submissions_.size());
    body["submissions"]["capacity"] = static_cast<Json::UInt64>(submissions_.capacity());
    return json_response(200, body);
}

HttpResponse GradingApi::info(const HttpRequest&) {
    const GatewayOptions& options = gateway_.options();
    Json::Value body;
    body["service"] = "gradebox";
    body["status"] = "running";
    body["description"] = "Sandboxed Python execution and grading";
    body["limits"]["max_timeout_seconds"] = options.max_timeout_seconds;
    body["limits"]["max_memory_limit_mb"] = static_cast<Json::UInt64>(options.max_memory_limit_mb);
    body["limits"]["max_test_cases"] = static_cast<Json::UInt64>(options.max_test_cases);
    body["limits"]["max_code_bytes"] = static_cast<Json::UInt64>(options.max_code_bytes);
    body["compare"] = OutputComparator::mode_to_string(options.harness.compare_mode);
    return json_response(200, body);
}

} // namespace gradebox
