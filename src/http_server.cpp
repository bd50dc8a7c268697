#include "http_server.h"
#include "constants.h"
#include "json_codec.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace gradebox {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_spaces(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

HttpResponse error_response(int status, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = JsonCodec::error_body(message);
    return resp;
}

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

HttpServer::HttpServer(int port, const std::string& bind_address)
    : port_(port), bind_address_(bind_address), server_fd_(-1), bound_port_(port), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + strerror(errno));
    }

    // Allow reuse
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[Http] SO_REUSEADDR failed: " << strerror(errno) << std::endl;
    }

    // Bind
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Invalid bind address: " + bind_address_);
    }

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_) + ": " + strerror(err));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        int err = errno;
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::string("Failed to listen: ") + strerror(err));
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &addr_len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    std::cout << "[Http] Listening on " << bind_address_ << ":" << bound_port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED || errno == EMFILE || errno == ENFILE)) {
                continue;
            }
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        // Wakes a blocked accept()
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

bool HttpServer::read_request(int client_fd, std::string& raw, HttpResponse& error) {
    raw.reserve(INITIAL_HTTP_BUFFER);
    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;

    while (true) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;

        raw.append(buffer, static_cast<size_t>(bytes_read));
        if (raw.size() > MAX_REQUEST_SIZE) {
            error = error_response(413, "Request exceeds " +
                                   std::to_string(MAX_REQUEST_SIZE / (1024 * 1024)) + "MB limit");
            return false;
        }

        if (expected_size == 0) {
            size_t header_end = raw.find("\r\n\r\n");
            if (header_end == std::string::npos) continue;

            HttpRequest head = parse_request(raw.substr(0, header_end + 4));
            std::string length_str = head.header("Content-Length");
            size_t content_length = 0;
            if (!length_str.empty()) {
                // Digits only: stoul accepts a sign and wraps "-1" around
                if (length_str.find_first_not_of("0123456789") != std::string::npos) {
                    error = error_response(400, "Invalid Content-Length");
                    return false;
                }
                content_length = length_str.size() > MAX_CONTENT_LENGTH_DIGITS
                                     ? MAX_REQUEST_SIZE + 1
                                     : std::stoul(length_str);
            }

            if (content_length > MAX_REQUEST_SIZE ||
                header_end + 4 + content_length > MAX_REQUEST_SIZE) {
                error = error_response(413, "Request exceeds " +
                                       std::to_string(MAX_REQUEST_SIZE / (1024 * 1024)) + "MB limit");
                return false;
            }
            expected_size = header_end + 4 + content_length;
        }

        if (raw.size() >= expected_size) break;
    }

    return !raw.empty();
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    struct timeval tv;
    tv.tv_sec = CLIENT_READ_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        std::cerr << "[Http] SO_RCVTIMEO failed: " << strerror(errno) << std::endl;
    }

    std::string request_data;
    HttpResponse error;
    if (!read_request(client_fd, request_data, error)) {
        if (error.status_code != 200) {
            send_all(client_fd, build_response(error));
        }
        return;
    }

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;
    req.cancel = std::make_shared<CancellationToken>();

    // Watch the connection while the handler runs; a peer hangup cancels the work
    std::atomic<bool> handler_done(false);
    std::atomic<bool> disconnected(false);
    std::shared_ptr<CancellationToken> cancel = req.cancel;
    std::thread watcher([client_fd, cancel, &handler_done, &disconnected]() {
        while (!handler_done) {
            struct pollfd pfd;
            pfd.fd = client_fd;
            pfd.events = POLLRDHUP;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, POLL_INTERVAL_MS * 5);
            if (ready > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR))) {
                disconnected = true;
                cancel->cancel("client disconnected");
                return;
            }
        }
    });

    HttpResponse resp = dispatch(req);

    handler_done = true;
    watcher.join();

    if (disconnected) {
        std::cout << "[Http] " << client_ip << " disconnected before " << req.method << " "
                  << req.path << " completed; response dropped" << std::endl;
        return;
    }

    if (!send_all(client_fd, build_response(resp))) {
        std::cerr << "[Http] Failed to write response to " << client_ip << ": "
                  << strerror(errno) << std::endl;
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) {
    if (req.method.empty() || req.path.empty()) {
        return error_response(400, "Malformed request line");
    }

    auto it = routes_.find(req.method + " " + req.path);
    if (it == routes_.end()) {
        return error_response(404, "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        std::cerr << "[Http] Handler for " << req.method << " " << req.path
                  << " threw: " << e.what() << std::endl;
        return error_response(500, e.what());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = space1 == std::string::npos ? std::string::npos : line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t query_pos = target.find('?');
        if (query_pos != std::string::npos) {
            req.query = target.substr(query_pos + 1);
            target.resize(query_pos);
        }
        req.path = target;
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[trim_spaces(line.substr(0, colon))] = trim_spaces(line.substr(colon + 1));
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace gradebox
