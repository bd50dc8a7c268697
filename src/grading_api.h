#pragma once

#include <string>
#include <functional>
#include <json/json.h>

#include "http_server.h"
#include "gateway.h"
#include "execution_pool.h"
#include "submission_store.h"

namespace gradebox {

// Sandbox readiness for /health; fills reason when not ready
using ReadyCheck = std::function<bool(std::string& reason)>;

// HTTP surface of the grading service
class GradingApi {
public:
    GradingApi(Gateway& gateway, ExecutionPool& pool, SubmissionStore& submissions, ReadyCheck ready);

    void register_routes(HttpServer& server);

    HttpResponse execute_code(const HttpRequest& req);
    HttpResponse submit_code(const HttpRequest& req);
    HttpResponse generate_challenge(const HttpRequest& req);
    HttpResponse health(const HttpRequest& req);
    HttpResponse stats(const HttpRequest& req);
    HttpResponse info(const HttpRequest& req);

private:
    Gateway& gateway_;
    ExecutionPool& pool_;
    SubmissionStore& submissions_;
    ReadyCheck ready_;

    // Shared validation/execution path; sets resp on rejection and returns false
    bool grade(const HttpRequest& req, RequestDraft& draft, ExecutionResponse& response, HttpResponse& resp);
};

HttpResponse json_response(int status, const Json::Value& body);

} // namespace gradebox
