#include <gtest/gtest.h>
#include "grading_api.h"
#include "fake_runner.h"
#include <json/json.h>

namespace gradebox {
namespace {

class GradingApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_unique<Gateway>(runner, pool);
        api = std::make_unique<GradingApi>(*gateway, pool, submissions,
                                           [](std::string&) { return true; });
    }

    HttpRequest submit(const std::string& body) {
        HttpRequest req;
        req.method = "POST";
        req.path = "/submit-code";
        req.client_ip = "127.0.0.1";
        req.body = body;
        req.cancel = std::make_shared<CancellationToken>();
        return req;
    }

    static Json::Value parse(const std::string& body) {
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        reader->parse(body.data(), body.data() + body.size(), &root, &errors);
        return root;
    }

    const std::string three_tests = R"json({
        "student_code": "print(input())",
        "student_id": "s-1",
        "lesson_id": "loops",
        "test_cases": [
            {"input": "a", "expected_output": "a"},
            {"input": "b", "expected_output": "b"},
            {"input": "c", "expected_output": "c"}
        ]
    })json";

    FakeRunner runner;
    ExecutionPool pool;
    SubmissionStore submissions;
    std::unique_ptr<Gateway> gateway;
    std::unique_ptr<GradingApi> api;
};

TEST_F(GradingApiTest, GradedSubmissionIsScoredAndStored) {
    HttpResponse resp = api->submit_code(submit(three_tests));

    ASSERT_EQ(resp.status_code, 200) << resp.body;
    Json::Value body = parse(resp.body);
    EXPECT_EQ(body["score"].asInt(), 100);
    EXPECT_FALSE(body.isMember("cancelled"));
    EXPECT_EQ(submissions.size(), 1u);
}

TEST_F(GradingApiTest, DeadlineDuringSubmissionIsMarkedCancelled) {
    // Given: The request deadline passes during the second test
    runner.outcomes.push_back(FakeRunner::completed("a\n"));
    runner.outcomes.push_back(FakeRunner::with_status(RunStatus::CANCELLED, "request deadline exceeded"));

    // When: Submitted
    HttpResponse resp = api->submit_code(submit(three_tests));

    // Then: Marked cancelled at the top level, with no score and nothing stored
    ASSERT_EQ(resp.status_code, 200) << resp.body;
    Json::Value body = parse(resp.body);
    EXPECT_TRUE(body["cancelled"].asBool());
    EXPECT_EQ(body["cancel_reason"].asString(), "request deadline exceeded");
    EXPECT_FALSE(body.isMember("score")) << "A zero score would read as a graded failure";
    EXPECT_FALSE(body.isMember("submission_id"));
    EXPECT_FALSE(body["success"].asBool());
    EXPECT_EQ(body["passed_tests"].asInt(), 1);
    EXPECT_EQ(body["total_tests"].asInt(), 3);
    EXPECT_TRUE(body["execution_result"]["cancelled"].asBool());
    EXPECT_EQ(submissions.size(), 0u);
}

TEST_F(GradingApiTest, DisconnectBeforeGradingIsMarkedCancelled) {
    HttpRequest req = submit(three_tests);
    req.cancel->cancel("client disconnected");

    HttpResponse resp = api->submit_code(req);

    Json::Value body = parse(resp.body);
    EXPECT_TRUE(body["cancelled"].asBool());
    EXPECT_EQ(body["cancel_reason"].asString(), "client disconnected");
    EXPECT_FALSE(body.isMember("score"));
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(submissions.size(), 0u);
}

} // namespace
} // namespace gradebox
