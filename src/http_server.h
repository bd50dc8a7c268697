#pragma once

#include <string>
#include <functional>
#include <map>
#include <memory>
#include <thread>
#include <atomic>

#include "cancellation.h"

namespace gradebox {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Cancelled when the client disconnects before the response is written
    std::shared_ptr<CancellationToken> cancel;

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per connection
class HttpServer {
public:
    explicit HttpServer(int port = 8083, const std::string& bind_address = "0.0.0.0");
    ~HttpServer();

    // Register an exact-match route
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks until stop())
    void start();

    // Stop server
    void stop();

    bool is_running() const { return running_; }

    // Port actually bound; differs from the constructor argument when it was 0
    int bound_port() const { return bound_port_; }

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    std::string bind_address_;
    int server_fd_;
    std::atomic<int> bound_port_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
    HttpResponse dispatch(const HttpRequest& req);
    bool read_request(int client_fd, std::string& raw, HttpResponse& error);
};

} // namespace gradebox
