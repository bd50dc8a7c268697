/**
 * HTTP Integration Tests
 *
 * Drives the grading API through real socket connections against a real
 * sandbox. Exercises the full request/response lifecycle.
 */

#include <gtest/gtest.h>
#include "../../src/http_server.h"
#include "../../src/grading_api.h"
#include "sandbox.h"
#include <thread>
#include <chrono>
#include <filesystem>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <atomic>
#include <json/json.h>

using namespace gradebox;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::unique_ptr<Sandbox> sandbox;
    std::unique_ptr<ExecutionPool> pool;
    std::unique_ptr<Gateway> gateway;
    std::unique_ptr<SubmissionStore> submissions;
    std::unique_ptr<GradingApi> api;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    int test_port = 0;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("gradebox_http_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(test_dir);

        SandboxConfig config;
        config.scratch_root = test_dir.string();
        sandbox = std::make_unique<Sandbox>(config);
        pool = std::make_unique<ExecutionPool>();
        gateway = std::make_unique<Gateway>(*sandbox, *pool);
        submissions = std::make_unique<SubmissionStore>();
        Sandbox* ready_sandbox = sandbox.get();
        api = std::make_unique<GradingApi>(*gateway, *pool, *submissions,
                                           [ready_sandbox](std::string& reason) {
                                               return ready_sandbox->check_ready(reason);
                                           });

        // Port 0: the kernel picks a free one
        server = std::make_unique<HttpServer>(0, "127.0.0.1");
        api->register_routes(*server);

        server_thread = std::thread([this]() {
            server->start();
        });

        // Wait for server to start
        int attempts = 0;
        while (!server->is_running() && attempts < 200) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            attempts++;
        }
        ASSERT_TRUE(server->is_running()) << "Server did not start";
        test_port = server->bound_port();
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        // Let detached connection threads finish before their collaborators go
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::filesystem::remove_all(test_dir);
    }

    // Helper: Connect to server
    int connect_to_server(int timeout_seconds = 30) {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(test_port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        struct timeval tv;
        tv.tv_sec = timeout_seconds;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }
        return sock;
    }

    // Helper: Send HTTP request and read until the server closes
    std::string send_request(const std::string& request) {
        int sock = connect_to_server();
        if (sock < 0) {
            return "CONNECTION_FAILED";
        }

        size_t sent = 0;
        while (sent < request.size()) {
            ssize_t n = send(sock, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                close(sock);
                return "SEND_FAILED";
            }
            sent += static_cast<size_t>(n);
        }

        // Server answers with Connection: close
        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<size_t>(n));
        }

        close(sock);
        return response;
    }

    std::string post(const std::string& path, const std::string& body) {
        return send_request(
            "POST " + path + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(body.length()) + "\r\n"
            "\r\n" + body);
    }

    std::string get(const std::string& path) {
        return send_request("GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
    }

    static Json::Value body_of(const std::string& response) {
        Json::Value root;
        size_t header_end = response.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return root;
        }
        Json::CharReaderBuilder builder;
        std::string errors;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string body = response.substr(header_end + 4);
        reader->parse(body.data(), body.data() + body.size(), &root, &errors);
        return root;
    }
};

// ============================================================================
// Health and Info
// ============================================================================

TEST_F(HttpIntegrationTest, HealthReportsReadySandbox) {
    // When: Probing health
    std::string response = get("/health");

    // Then: Healthy with a ready sandbox
    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u) << "Got:\n" << response;
    Json::Value body = body_of(response);
    EXPECT_EQ(body["status"].asString(), "healthy");
    EXPECT_EQ(body["sandbox"].asString(), "ready");
}

TEST_F(HttpIntegrationTest, ResponseHeaders) {
    std::string response = get("/health");

    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos)
        << "Should include CORS header. Got:\n" << response;
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
}

TEST_F(HttpIntegrationTest, ServiceInfo) {
    Json::Value body = body_of(get("/"));

    EXPECT_EQ(body["service"].asString(), "gradebox");
    EXPECT_EQ(body["limits"]["max_timeout_seconds"].asInt(), MAX_TIMEOUT_SECONDS);
}

// ============================================================================
// Grading Endpoints
// ============================================================================

TEST_F(HttpIntegrationTest, ExecuteCodeGradesTests) {
    // Given: A greeting program and two tests, one wrong
    std::string request = R"json({
        "code": "name = input()\nprint(f\"Hello, {name}!\")",
        "test_cases": [
            {"input": "Ada\n", "expected_output": "Hello, Ada!"},
            {"input": "Bob\n", "expected_output": "Hi, Bob!"}
        ]
    })json";

    // When: Posted
    std::string response = post("/execute-code", request);

    // Then: Per-test results in order
    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u) << "Got:\n" << response;
    Json::Value body = body_of(response);
    EXPECT_FALSE(body["success"].asBool());
    EXPECT_EQ(body["total_tests"].asInt(), 2);
    EXPECT_EQ(body["passed_tests"].asInt(), 1);
    ASSERT_EQ(body["test_results"].size(), 2u);
    EXPECT_TRUE(body["test_results"][0]["passed"].asBool());
    EXPECT_EQ(body["test_results"][1]["actual_output"].asString(), "Hello, Bob!");
    EXPECT_TRUE(body["syntax_errors"].isArray());
    EXPECT_TRUE(body["hints_triggered"].isArray());
    EXPECT_FALSE(body.isMember("overall_output"));
}

TEST_F(HttpIntegrationTest, SyntaxErrorResponse) {
    std::string response = post("/execute-code",
                                R"json({"code": "def f(:\n  pass", "test_cases": [{"expected_output": ""}]})json");

    Json::Value body = body_of(response);
    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u);
    EXPECT_FALSE(body["success"].asBool());
    EXPECT_EQ(body["test_results"].size(), 0u);
    EXPECT_EQ(body["syntax_errors"].size(), 1u);
    EXPECT_EQ(body["overall_output"].asString(), "");
}

TEST_F(HttpIntegrationTest, SubmitCodeReturnsScore) {
    std::string request = R"json({
        "student_code": "print(int(input()) * 2)",
        "student_id": "s-42",
        "lesson_id": 7,
        "test_cases": [
            {"input": "1", "expected_output": "2"},
            {"input": "2", "expected_output": "4"},
            {"input": "3", "expected_output": "7"}
        ]
    })json";

    std::string response = post("/submit-code", request);

    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u) << "Got:\n" << response;
    Json::Value body = body_of(response);
    EXPECT_EQ(body["score"].asInt(), 67);
    EXPECT_EQ(body["passed_tests"].asInt(), 2);
    EXPECT_EQ(body["submission_id"].asString().size(), 32u);
    EXPECT_FALSE(body["submitted_at"].asString().empty());
    EXPECT_EQ(body["execution_result"]["total_tests"].asInt(), 3);
    EXPECT_EQ(submissions->size(), 1u);
}

TEST_F(HttpIntegrationTest, InvalidRequestsReturn400) {
    std::string not_json = post("/execute-code", "{not json");
    EXPECT_EQ(not_json.find("HTTP/1.1 400"), 0u) << "Got:\n" << not_json;
    EXPECT_FALSE(body_of(not_json)["error"].asString().empty());

    std::string no_tests = post("/execute-code", R"json({"code": "print(1)", "test_cases": []})json");
    EXPECT_EQ(no_tests.find("HTTP/1.1 400"), 0u);

    std::string bad_timeout = post("/execute-code",
        R"json({"code": "print(1)", "timeout_seconds": -1, "test_cases": [{"expected_output": "1"}]})json");
    EXPECT_EQ(bad_timeout.find("HTTP/1.1 400"), 0u);
}

TEST_F(HttpIntegrationTest, MalformedContentLengthReturns400) {
    // Given: Length headers that are not a plain decimal count
    for (const std::string& length : {"-1", "+2", "2x", "0x2", "1 2"}) {
        // When: Sent with a small body
        std::string response = send_request(
            "POST /execute-code HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Length: " + length + "\r\n"
            "\r\n{}");

        // Then: Rejected before any body handling
        EXPECT_EQ(response.find("HTTP/1.1 400"), 0u) << length << " got:\n" << response;
        EXPECT_EQ(body_of(response)["error"].asString(), "Invalid Content-Length");
    }
}

TEST_F(HttpIntegrationTest, HugeContentLengthReturns413) {
    std::string response = send_request(
        "POST /execute-code HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 18446744073709551615\r\n"
        "\r\n{}");

    EXPECT_EQ(response.find("HTTP/1.1 413"), 0u) << "Got:\n" << response;
}

TEST_F(HttpIntegrationTest, ChallengeGenerationNotImplemented) {
    std::string response = post("/generate-new-challenge", "{}");

    EXPECT_EQ(response.find("HTTP/1.1 501"), 0u) << "Got:\n" << response;
}

TEST_F(HttpIntegrationTest, RouteAndMethodMismatchReturn404) {
    EXPECT_EQ(get("/nonexistent").find("HTTP/1.1 404"), 0u);
    EXPECT_EQ(get("/execute-code").find("HTTP/1.1 404"), 0u);
    EXPECT_EQ(get("/health/extra").find("HTTP/1.1 404"), 0u);
}

TEST_F(HttpIntegrationTest, QueryStringDoesNotAffectRouting) {
    EXPECT_EQ(get("/health?verbose=1").find("HTTP/1.1 200 OK"), 0u);
}

// ============================================================================
// Connection Handling
// ============================================================================

TEST_F(HttpIntegrationTest, ConcurrentRequests) {
    // When: Several clients grade at once
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([this, i, &succeeded]() {
            std::string request = "{\"code\": \"print(" + std::to_string(i) + ")\", "
                                  "\"test_cases\": [{\"expected_output\": \"" + std::to_string(i) + "\"}]}";
            if (body_of(post("/execute-code", request))["success"].asBool()) {
                ++succeeded;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Then: Each gets its own correct result
    EXPECT_EQ(succeeded.load(), 4);
}

TEST_F(HttpIntegrationTest, ClientDisconnectCancelsRun) {
    // Given: A client posting slow code
    std::string body = R"json({"code": "import time\ntime.sleep(30)", "timeout_seconds": 30,
                           "test_cases": [{"expected_output": ""}]})json";
    std::string request =
        "POST /submit-code HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    int sock = connect_to_server();
    ASSERT_GE(sock, 0);
    ASSERT_EQ(send(sock, request.data(), request.size(), MSG_NOSIGNAL),
              static_cast<ssize_t>(request.size()));

    // When: It hangs up while the program runs
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    close(sock);

    // Then: The slot is released well before the program's timeout
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline &&
           (pool->stats().active > 0 || pool->stats().completed == 0)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(pool->stats().active, 0);
    EXPECT_EQ(pool->stats().completed, 1);
    EXPECT_EQ(submissions->size(), 0u) << "Cancelled submissions are not recorded";
}

TEST_F(HttpIntegrationTest, StatsReflectActivity) {
    post("/execute-code", R"json({"code": "print(1)", "test_cases": [{"expected_output": "1"}]})json");

    Json::Value body = body_of(get("/stats"));

    EXPECT_EQ(body["pool"]["capacity"].asInt(), MAX_CONCURRENT_EXECUTIONS);
    EXPECT_EQ(body["pool"]["active"].asInt(), 0);
    EXPECT_GE(body["pool"]["completed"].asInt(), 1);
}
